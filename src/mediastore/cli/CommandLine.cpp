#include <mediastore/cli/CommandLine.hpp>

#include <charconv>
#include <sstream>
#include <utility>

namespace MS::Cli {

CommandLine::CommandLine(std::string programName)
    : programName_(std::move(programName)) {}

auto CommandLine::addFlag(std::string_view name, FlagOption option) -> void {
    add(Entry{.name = std::string{name}, .expectsValue = false, .help = std::move(option.help), .valueName = {}, .onFlag = std::move(option.onSet), .onValue = {}});
}

auto CommandLine::addValue(std::string_view name, ValueOption option) -> void {
    add(Entry{.name         = std::string{name},
              .expectsValue = true,
              .help         = std::move(option.help),
              .valueName    = std::move(option.valueName),
              .onFlag       = {},
              .onValue      = std::move(option.onValue)});
}

auto CommandLine::addDouble(std::string_view name, std::function<void(double)> onValue, std::string help) -> void {
    ValueOption option;
    option.help      = std::move(help);
    option.valueName = "number";
    option.onValue   = [stored = std::string{name}, handler = std::move(onValue)](std::string_view token) -> ParseError {
        std::istringstream stream{std::string{token}};
        double             value = 0.0;
        stream >> value;
        if (token.empty() || stream.fail() || !stream.eof())
            return stored + " expects a number, got '" + std::string{token} + "'";
        handler(value);
        return std::nullopt;
    };
    addValue(name, std::move(option));
}

auto CommandLine::addInt(std::string_view name, std::function<void(int)> onValue, std::string help) -> void {
    ValueOption option;
    option.help      = std::move(help);
    option.valueName = "n";
    option.onValue   = [stored = std::string{name}, handler = std::move(onValue)](std::string_view token) -> ParseError {
        int  value  = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || result.ec != std::errc{} || result.ptr != token.data() + token.size())
            return stored + " expects an integer, got '" + std::string{token} + "'";
        handler(value);
        return std::nullopt;
    };
    addValue(name, std::move(option));
}

auto CommandLine::addAlias(std::string_view alias, std::string_view target) -> void {
    auto it = lookup_.find(std::string{target});
    if (it == lookup_.end()) {
        fail("alias '" + std::string{alias} + "' names unknown option '" + std::string{target} + "'");
        return;
    }
    lookup_.emplace(std::string{alias}, it->second);
}

auto CommandLine::parse(int argc, char const* const* argv) -> bool {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i)
        arguments.emplace_back(argv[i]);
    return parse(arguments);
}

auto CommandLine::parse(std::vector<std::string> const& arguments) -> bool {
    errors_.clear();
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        std::string_view                token{arguments[i]};
        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (auto equals = token.find('='); equals != std::string_view::npos && token.starts_with("--")) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* entry = find(name);
        if (!entry) {
            fail("unknown argument '" + std::string{token} + "'");
            continue;
        }

        if (!entry->expectsValue) {
            if (attached) {
                fail(entry->name + " does not take a value");
                continue;
            }
            if (entry->onFlag)
                entry->onFlag();
            continue;
        }

        auto value = attached;
        if (!value) {
            if (i + 1 >= arguments.size()) {
                fail(entry->name + " requires a " + entry->valueName);
                continue;
            }
            value = std::string_view{arguments[++i]};
        }
        if (entry->onValue) {
            if (auto error = entry->onValue(*value))
                fail(*error);
        }
    }
    return errors_.empty();
}

auto CommandLine::usage() const -> std::string {
    std::string text = "Usage: " + programName_ + " [options]\nOptions:\n";
    for (auto const& entry : entries_) {
        std::string left = "  " + entry.name;
        if (entry.expectsValue)
            left += " <" + entry.valueName + ">";
        if (left.size() < 28)
            left.resize(28, ' ');
        else
            left.push_back(' ');
        text += left + entry.help + "\n";
    }
    return text;
}

auto CommandLine::find(std::string_view name) -> Entry* {
    auto it = lookup_.find(std::string{name});
    if (it == lookup_.end())
        return nullptr;
    return &entries_[it->second];
}

auto CommandLine::add(Entry entry) -> void {
    auto name = entry.name;
    entries_.push_back(std::move(entry));
    lookup_.insert_or_assign(std::move(name), entries_.size() - 1);
}

auto CommandLine::fail(std::string_view message) -> void {
    errors_.push_back(programName_ + ": " + std::string{message});
}

} // namespace MS::Cli
