// Orexa - Game Server Supervisor
// Console line parser implementation

#include "orexa/console/console_parser.hpp"
#include "orexa/core/types.hpp"

#include <cerrno>
#include <cstdlib>
#include <regex>

namespace orexa {
namespace console {

namespace {

// Player names: anything without whitespace, brackets, colons or apostrophes
#define OREXA_PLAYER_NAME R"re(([^\s\[\]:']+))re"

struct ConsolePatterns {
    const std::regex ansi{R"re(\x1b\[[0-9;]*m)re"};
    const std::regex mcColor{"\xC2\xA7[0-9a-fk-or]"};

    const std::regex join{OREXA_PLAYER_NAME R"re(\[/([0-9a-fA-F:.]+):\d+\] logged in)re"};
    const std::regex leave{OREXA_PLAYER_NAME R"re( left the game)re"};

    const std::regex paperTps{R"re(TPS from last 1m, 5m, 15m: \*?([0-9.]+))re"};
    const std::regex forgeTps{
        R"re(overall:\s*(?:tps[:=]\s*)?([0-9.]+)\s*tps\b|overall:.*\btps[:=]\s*([0-9.]+))re",
        std::regex::ECMAScript | std::regex::icase};
    const std::regex simpleTps{R"re(\bTPS[:=]\s*([0-9.]+))re",
                               std::regex::ECMAScript | std::regex::icase};

    const std::regex dimension{
        OREXA_PLAYER_NAME R"re( has the following entity data: "minecraft:(\w+)")re"};
    const std::regex list{R"re(There are (\d+) of a max of (\d+) players online:\s*(.*))re"};

    const std::regex ping1{R"re(ping of )re" OREXA_PLAYER_NAME R"re( (?:is|was) ([0-9]+))re",
                           std::regex::ECMAScript | std::regex::icase};
    const std::regex ping2{OREXA_PLAYER_NAME R"re('?s ping(?: is|:)? ([0-9]+))re",
                           std::regex::ECMAScript | std::regex::icase};
    const std::regex ping3{OREXA_PLAYER_NAME R"re( has (?:a )?ping(?: of)? ([0-9]+))re",
                           std::regex::ECMAScript | std::regex::icase};
    const std::regex ping4{OREXA_PLAYER_NAME R"re('s latency is ([0-9]+)\s*ms)re",
                           std::regex::ECMAScript | std::regex::icase};
    const std::regex pingNotFound{R"re(player not found or offline)re",
                                  std::regex::ECMAScript | std::regex::icase};
};

#undef OREXA_PLAYER_NAME

const ConsolePatterns& patterns() {
    static const ConsolePatterns instance;
    return instance;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool parseInt(const std::string& text, int32_t& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value > INT32_MAX || value < INT32_MIN) {
        return false;
    }
    out = static_cast<int32_t>(value);
    return true;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

void addTps(ConsoleParseResult& result, const std::string& text) {
    double tps = 0.0;
    if (parseDouble(text, tps)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::TpsReport;
        event.tps = tps;
        result.events.push_back(std::move(event));
    }
    result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Tps);
}

void addLatency(ConsoleParseResult& result, const std::smatch& match) {
    int32_t latency = 0;
    if (parseInt(match[2].str(), latency)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::PlayerLatency;
        event.player = match[1].str();
        event.latencyMs = latency;
        result.events.push_back(std::move(event));
    }
    result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Latency);
}

} // anonymous namespace

std::string stripFormatting(const std::string& line) {
    const ConsolePatterns& p = patterns();
    std::string clean = std::regex_replace(line, p.ansi, "");
    clean = std::regex_replace(clean, p.mcColor, "");
    while (!clean.empty() && (clean.back() == ' ' || clean.back() == '\r')) {
        clean.pop_back();
    }
    return clean;
}

std::string worldDisplayName(const std::string& dimension) {
    if (dimension == "overworld") {
        return "Overworld";
    }
    if (dimension == "the_nether") {
        return "Nether";
    }
    if (dimension == "the_end") {
        return "The End";
    }
    return dimension;
}

ConsoleParseResult parseConsoleLine(const std::string& line) {
    const ConsolePatterns& p = patterns();
    ConsoleParseResult result;
    result.clean = stripFormatting(line);
    const std::string& clean = result.clean;
    std::smatch match;

    if (contains(clean, "Done (") && (contains(clean, "! For help,") || contains(clean, ")!"))) {
        ConsoleEvent event;
        event.type = ConsoleEventType::Ready;
        result.events.push_back(std::move(event));
    }

    if (std::regex_search(clean, match, p.join)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::PlayerJoined;
        event.player = match[1].str();
        event.ip = match[2].str();
        result.events.push_back(std::move(event));
    }

    if (std::regex_search(clean, match, p.leave)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::PlayerLeft;
        event.player = match[1].str();
        result.events.push_back(std::move(event));
    }

    // Several TPS formats may appear on one line; the last one wins
    if (std::regex_search(clean, match, p.paperTps)) {
        addTps(result, match[1].str());
    }
    if (std::regex_search(clean, match, p.forgeTps)) {
        addTps(result, match[1].matched ? match[1].str() : match[2].str());
    }
    if (std::regex_search(clean, match, p.simpleTps)) {
        addTps(result, match[1].str());
    }

    if (std::regex_search(clean, match, p.dimension)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::PlayerWorld;
        event.player = match[1].str();
        event.world = worldDisplayName(match[2].str());
        result.events.push_back(std::move(event));
        result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Roster);
    }

    if (std::regex_search(clean, match, p.list)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::PlayerList;
        parseInt(match[1].str(), event.online);
        parseInt(match[2].str(), event.maxPlayers);
        for (const auto& name : core::split(core::trim(match[3].str()), ',')) {
            std::string trimmed = core::trim(name);
            if (!trimmed.empty()) {
                event.players.push_back(trimmed);
            }
        }
        result.events.push_back(std::move(event));
        result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Roster);
    }

    if (std::regex_search(clean, match, p.ping1) ||
        std::regex_search(clean, match, p.ping2) ||
        std::regex_search(clean, match, p.ping3) ||
        std::regex_search(clean, match, p.ping4)) {
        addLatency(result, match);
    } else if (std::regex_search(clean, p.pingNotFound)) {
        ConsoleEvent event;
        event.type = ConsoleEventType::PlayerNotFound;
        result.events.push_back(std::move(event));
        result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Latency);
    }

    // Command echoes and error replies of the polling commands
    if (contains(clean, "issued server command: /tps")) {
        result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Tps);
    }
    if (contains(clean, "issued server command: /minecraft:list") ||
        contains(clean, "issued server command: /list") ||
        contains(clean, "issued server command: /data") ||
        contains(clean, "No entity was found")) {
        result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Roster);
    }
    if (contains(clean, "issued server command: /ping") ||
        contains(clean, "issued server command: /essentials:ping")) {
        result.echoFamilies |= static_cast<uint8_t>(EchoFamily::Latency);
    }

    return result;
}

} // namespace console
} // namespace orexa
