#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace MS::Cli {

/**
 * CommandLine: small ordered option parser for the mediastore tools.
 *
 * Handlers run in the order their options appear on the command line, which
 * lets tools treat options as a command script. Values may be attached
 * (--name=value) or passed as the next token. Every problem is collected in
 * errors(); parse() returns false when there was at least one.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    struct FlagOption {
        std::function<void()> onSet;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> onValue;
        std::string                                 help;
        std::string                                 valueName = "value";
    };

    explicit CommandLine(std::string programName);

    auto addFlag(std::string_view name, FlagOption option) -> void;
    auto addValue(std::string_view name, ValueOption option) -> void;
    auto addDouble(std::string_view name, std::function<void(double)> onValue, std::string help) -> void;
    auto addInt(std::string_view name, std::function<void(int)> onValue, std::string help) -> void;
    auto addAlias(std::string_view alias, std::string_view target) -> void;

    [[nodiscard]] auto parse(int argc, char const* const* argv) -> bool;
    [[nodiscard]] auto parse(std::vector<std::string> const& arguments) -> bool;

    [[nodiscard]] auto errors() const -> std::vector<std::string> const& { return errors_; }
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct Entry {
        std::string                                 name;
        bool                                        expectsValue = false;
        std::string                                 help;
        std::string                                 valueName;
        std::function<void()>                       onFlag;
        std::function<ParseError(std::string_view)> onValue;
    };

    auto find(std::string_view name) -> Entry*;
    auto add(Entry entry) -> void;
    auto fail(std::string_view message) -> void;

    std::string                                  programName_;
    std::vector<Entry>                           entries_;
    std::unordered_map<std::string, std::size_t> lookup_;
    std::vector<std::string>                     errors_;
};

} // namespace MS::Cli
