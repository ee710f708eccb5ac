#include "paddock/protocol/names.hpp"

#include <array>

namespace paddock::protocol {

namespace {

constexpr std::array<std::string_view, kPacketIdCount> kPacketIdNames = {
    "Motion",   "Session",      "LapData",   "Event",
    "Participants", "CarSetups", "CarTelemetry", "CarStatus",
    "FinalClassification", "LobbyInfo",
};

// Indexed by team id 0..56. Empty entries are ids the game never sends.
constexpr std::array<std::string_view, 57> kTeamNames = {
    "Mercedes",
    "Ferrari",
    "Red Bull Racing",
    "Williams",
    "Racing Point",
    "Renault",
    "AlphaTauri",
    "Haas",
    "McLaren",
    "Alfa Romeo",
    "McLaren 1988",
    "McLaren 1991",
    "Williams 1992",
    "Ferrari 1995",
    "Williams 1996",
    "McLaren 1998",
    "Ferrari 2002",
    "Ferrari 2004",
    "Renault 2006",
    "Ferrari 2007",
    "McLaren 2008",
    "Red Bull 2010",
    "Ferrari 1976",
    "ART Grand Prix",
    "Campos Vexatec Racing",
    "Carlin",
    "Charouz Racing System",
    "DAMS",
    "Russian Time",
    "MP Motorsport",
    "Pertamina",
    "McLaren 1990",
    "Trident",
    "BWT Arden",
    "McLaren 1976",
    "Lotus 1972",
    "Ferrari 1979",
    "McLaren 1982",
    "Williams 2003",
    "Brawn 2009",
    "Lotus 1978",
    "F1 Generic car",
    "Art GP '19",
    "Campos '19",
    "Carlin '19",
    "Sauber Junior Charouz '19",
    "Dams '19",
    "Uni-Virtuosi '19",
    "MP Motorsport '19",
    "Prema '19",
    "Trident '19",
    "Arden '19",
    "",
    "Benetton 1994",
    "Benetton 1995",
    "Ferrari 2000",
    "Jordan 1991",
};

constexpr uint8_t kMyTeamId = 255;

constexpr std::array<std::string_view, 28> kTrackNames = {
    "Unknown",     "Melbourne",    "Paul Ricard",       "Shanghai",     "Sakhir (Bahrain)",
    "Catalunya",   "Monaco",       "Montreal",          "Silverstone",  "Hockenheim",
    "Hungaroring", "Spa",          "Monza",             "Singapore",    "Suzuka",
    "Abu Dhabi",   "Texas",        "Brazil",            "Austria",      "Sochi",
    "Mexico",      "Baku",         "Sakhir Short",      "Silverstone Short",
    "Texas Short", "Suzuka Short", "Hanoi",             "Zandvoort",
};

} // namespace

std::string_view packet_id_name(PacketId id) {
    return kPacketIdNames[static_cast<size_t>(id)];
}

std::optional<PacketId> parse_packet_id(std::string_view name) {
    for (size_t i = 0; i < kPacketIdNames.size(); ++i) {
        if (kPacketIdNames[i] == name) {
            return static_cast<PacketId>(i);
        }
    }
    return std::nullopt;
}

std::string_view team_name(uint8_t team_id) {
    if (team_id == kMyTeamId) {
        return "My Team";
    }
    if (team_id < kTeamNames.size() && !kTeamNames[team_id].empty()) {
        return kTeamNames[team_id];
    }
    return "[N/A]";
}

std::string_view team_color(uint8_t team_id) {
    switch (team_id) {
    case 0:
        return "#00D2BE";
    case 1:
        return "#C00000";
    case 2:
        return "#0600EF";
    case 3:
        return "#0082FA";
    case 4:
        return "#F596C8";
    case 5:
        return "#FFF500";
    case 6:
        return "#C8C8C8";
    case 7:
        return "#787878";
    case 8:
        return "#FF8700";
    case 9:
        return "#960000";
    default:
        return "#000000";
    }
}

std::string_view track_name(Track track) {
    // Track ids start at -1 (Unknown).
    const int index = static_cast<int>(track) + 1;
    if (index < 0 || index >= static_cast<int>(kTrackNames.size())) {
        return "Unknown";
    }
    return kTrackNames[static_cast<size_t>(index)];
}

std::string_view compound_label(VisualTyreCompound compound) {
    switch (compound) {
    case VisualTyreCompound::Soft:
    case VisualTyreCompound::F2SuperSoft:
    case VisualTyreCompound::F2Soft:
        return "Soft";
    case VisualTyreCompound::Medium:
    case VisualTyreCompound::F2Medium:
        return "Medium";
    case VisualTyreCompound::Hard:
    case VisualTyreCompound::F2Hard:
        return "Hard";
    case VisualTyreCompound::Inter:
        return "Inter";
    case VisualTyreCompound::Wet:
    case VisualTyreCompound::ClassicWet:
    case VisualTyreCompound::F2Wet:
        return "Wet";
    case VisualTyreCompound::ClassicDry:
        return "Dry";
    case VisualTyreCompound::Unknown:
    case VisualTyreCompound::NotSet:
        break;
    }
    return "[N/A]";
}

} // namespace paddock::protocol
