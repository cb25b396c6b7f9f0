#include <mediastore/MediaStore.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using Command = std::function<MS::Future<MS::Value>(MS::MediaStore&)>;

struct DumpOptions {
    std::vector<std::pair<std::string, Command>> commands;
    int                                          indent = 2;
    std::optional<std::filesystem::path>         outputPath;
    std::chrono::milliseconds                    settle{1000};
    bool                                         help = false;
};

auto parse_cli(int argc, char** argv, DumpOptions& options) -> MS::Cli::CommandLine {
    MS::Cli::CommandLine cli{"mediastore_dump"};

    cli.addValue("--source", {.onValue = [&](std::string_view url) -> MS::Cli::CommandLine::ParseError {
                                  if (url.empty())
                                      return std::string{"--source requires a url"};
                                  options.commands.emplace_back("loadSource", [source = std::string{url}](MS::MediaStore& store) {
                                      return store.request("loadSource", source, MS::RequestMeta{.source = "cli", .reason = "--source"});
                                  });
                                  return std::nullopt;
                              },
                              .help      = "Load a source (cancels every live request)",
                              .valueName = "url"});
    cli.addDouble(
            "--volume",
            [&](double volume) {
                options.commands.emplace_back("changeVolume", [volume](MS::MediaStore& store) { return store.request("changeVolume", volume); });
            },
            "Change the volume, clamped to [0, 1]");
    cli.addFlag("--mute", {.onSet = [&] {
                               options.commands.emplace_back("setMuted", [](MS::MediaStore& store) { return store.request("setMuted", true); });
                           },
                           .help = "Mute"});
    cli.addFlag("--toggle-mute", {.onSet = [&] {
                                      options.commands.emplace_back("toggleMute", [](MS::MediaStore& store) { return store.request("toggleMute"); });
                                  },
                                  .help = "Toggle mute"});
    cli.addDouble(
            "--seek",
            [&](double time) { options.commands.emplace_back("seek", [time](MS::MediaStore& store) { return store.request("seek", time); }); },
            "Seek to a time in seconds");
    cli.addFlag("--play", {.onSet = [&] {
                               options.commands.emplace_back("play", [](MS::MediaStore& store) { return store.request("play"); });
                           },
                           .help = "Start playback"});
    cli.addFlag("--pause", {.onSet = [&] {
                                options.commands.emplace_back("pause", [](MS::MediaStore& store) { return store.request("pause"); });
                            },
                            .help = "Pause playback"});
    cli.addInt(
            "--settle-ms", [&](int ms) { options.settle = std::chrono::milliseconds{ms < 0 ? 0 : ms}; },
            "Virtual time allowed per command (default 1000)");
    cli.addInt("--indent", [&](int indent) { options.indent = indent; }, "JSON indent (default 2, -1 for compact)");
    cli.addValue("--output", {.onValue = [&](std::string_view path) -> MS::Cli::CommandLine::ParseError {
                                  if (path.empty())
                                      return std::string{"--output requires a file"};
                                  options.outputPath = std::filesystem::path{std::string{path}};
                                  return std::nullopt;
                              },
                              .help      = "Write JSON to file instead of stdout",
                              .valueName = "file"});
    cli.addFlag("--help", {.onSet = [&] { options.help = true; }, .help = "Show this message"});
    cli.addAlias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        for (auto const& error : cli.errors())
            std::cerr << error << "\n";
    }
    return cli;
}

auto write_output(std::string const& json, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << json << std::endl;
        return true;
    }
    if (auto parent = output->parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Failed to create '" << parent.string() << "': " << ec.message() << std::endl;
            return false;
        }
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << json << '\n';
    if (!stream.good()) {
        std::cerr << "Failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    MS::set_thread_name("Main");

    DumpOptions options;
    auto        cli = parse_cli(argc, argv, options);
    if (options.help) {
        std::cout << cli.usage();
        return EXIT_SUCCESS;
    }
    if (!cli.errors().empty()) {
        std::cerr << cli.usage();
        return EXIT_FAILURE;
    }

    int              failures = 0;
    MS::EventLoop    loop;
    MS::MediaElement element{loop};
    auto             config = MS::mediaStoreConfig();
    config.onError          = [](MS::ErrorContext const& context) {
        std::cerr << "mediastore_dump: " << MS::errorSourceToString(context.source) << " " << context.origin << ": "
                  << MS::describeError(context.error) << std::endl;
    };
    MS::MediaStore store{loop, std::move(config)};

    if (auto attached = store.attach(element); !attached) {
        std::cerr << "Attach failed: " << MS::describeError(attached.error()) << std::endl;
        return EXIT_FAILURE;
    }

    for (auto const& [name, command] : options.commands) {
        command(store).then([&failures](MS::Expected<MS::Value> const& result) {
            if (!result && !MS::isCancellation(result.error()))
                ++failures;
        });
        loop.runUntilIdle();
        loop.advance(options.settle);
        loop.runUntilIdle();
    }
    store.flush();

    auto json = MS::StateJson::exportStore(store).dump(options.indent);
    if (!write_output(json, options.outputPath))
        return EXIT_FAILURE;
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
