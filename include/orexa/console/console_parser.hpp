// Orexa - Game Server Supervisor
// Console line parser
//
// Turns one raw line of game-server output into the structured events it
// carries (ready banner, joins and leaves, TPS reports, roster listings,
// latency answers). Pure: no instance state is read or written here.

#ifndef OREXA_CONSOLE_CONSOLE_PARSER_HPP
#define OREXA_CONSOLE_CONSOLE_PARSER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace orexa {
namespace console {

enum class ConsoleEventType {
    Ready,             ///< "Done (...)! For help," boot banner
    PlayerJoined,      ///< player, ip
    PlayerLeft,        ///< player
    TpsReport,         ///< tps
    PlayerWorld,       ///< player, world (display name)
    PlayerList,        ///< players, online, maxPlayers
    PlayerLatency,     ///< player, latencyMs
    PlayerNotFound     ///< latency query target is offline
};

/**
 * @brief One fact extracted from a console line.
 *
 * Only the fields listed for the event type are meaningful.
 */
struct ConsoleEvent {
    ConsoleEventType type = ConsoleEventType::Ready;
    std::string player;
    std::string ip;
    std::string world;
    double tps = 0.0;
    int32_t latencyMs = -1;
    int32_t online = 0;
    int32_t maxPlayers = 0;
    std::vector<std::string> players;
};

/**
 * @brief Families of supervisor-issued polling commands.
 */
enum class EchoFamily : uint8_t {
    None = 0,
    Tps = 1 << 0,
    Roster = 1 << 1,       ///< list and per-player data queries
    Latency = 1 << 2
};

/**
 * @brief Parse outcome for one line.
 */
struct ConsoleParseResult {
    std::string clean;                   ///< Line without ANSI and color codes
    std::vector<ConsoleEvent> events;    ///< In detection order

    /**
     * @brief Bitmask of EchoFamily values.
     *
     * A line answering (or echoing) a polling command of a family is hidden
     * from viewers when that family's command was issued recently.
     */
    uint8_t echoFamilies = 0;

    bool isEchoOf(EchoFamily family) const {
        return (echoFamilies & static_cast<uint8_t>(family)) != 0;
    }
};

/**
 * @brief Remove ANSI SGR sequences, section-sign color codes and trailing
 * spaces or carriage returns.
 */
std::string stripFormatting(const std::string& line);

/**
 * @brief Map a "minecraft:<dimension>" id to its display name.
 *
 * overworld, the_nether and the_end get friendly names; anything else is
 * returned unchanged.
 */
std::string worldDisplayName(const std::string& dimension);

/**
 * @brief Parse one raw output line.
 */
ConsoleParseResult parseConsoleLine(const std::string& line);

} // namespace console
} // namespace orexa

#endif // OREXA_CONSOLE_CONSOLE_PARSER_HPP
