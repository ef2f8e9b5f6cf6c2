//
//  main.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "frame_id.hpp"
#include "id3forge.hpp"
#include "id3forge_version.hpp"
#include "logging.hpp"
#include "tag_file.hpp"

namespace {

struct CliOptions {
    bool frame_flags = false;
    bool human_readable = false;
    bool json = false;
    std::optional<uint32_t> index;  // 1-based
    std::optional<std::string> log_level;
    std::optional<std::string> config_path;
    std::string output_path;
    std::vector<std::string> positional;
};

void print_usage() {
    std::cerr << "ID3Forge " << ID3FORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  id3forge read <file.mp3> [--frame-flags] [--json]\n"
              << "  id3forge write <file.mp3> <FRAME_ID> <data>\n"
              << "  id3forge edit <file.mp3> <FRAME_ID> <data> [--index N]\n"
              << "  id3forge delete <file.mp3> <FRAME_ID> [--index N]\n"
              << "Options:\n"
              << "  -H, --human-readable  Print values (flags) as readable as possible.\n"
              << "  --frame-flags         Also print each frame's flags when reading.\n"
              << "  --json                Print the tag as JSON when reading.\n"
              << "  -i, --index N         Which frame with that ID, starting at 1 (default 1).\n"
              << "  --output FILE         Write the result to FILE instead of the input.\n"
              << "  --config FILE         Read settings from a JSON config file.\n"
              << "  --log-level LEVEL     error|warn|info|debug (default: info).\n"
              << "  -v, --version         Print the version and exit.\n"
              << "  -h, --help            Print this help and exit.\n";
}

std::optional<uint32_t> parse_index(const std::string &s) {
    try {
        size_t used = 0;
        const unsigned long v = std::stoul(s, &used);
        if (used != s.size() || v > 0xFFFFFFFFul) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(v);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

// Invalid IDs stop the command; unknown (but well-formed) IDs only warn.
bool validate_frame_id(const std::string &frame_id, id3forge::Logger &log) {
    if (!is_valid_frame_id(frame_id)) {
        ID3F_LOG(log, "error", "provided frame id \""
                                   << frame_id
                                   << "\" is not valid. It must be a four-character word "
                                      "composed exclusively of numbers or uppercase letters");
        return false;
    }
    if (!is_known_frame_id(frame_id)) {
        ID3F_LOG(log, "warn", "provided frame id \""
                                  << frame_id
                                  << "\" is not a known id. The operation will still be executed");
    }
    return true;
}

int finish_write(id3forge::TagFile &tag, const CliOptions &cli, id3forge::Logger &log) {
    const std::string dest = cli.output_path.empty() ? tag.path() : cli.output_path;
    const auto status = tag.save_as(dest);
    if (!status.ok) {
        ID3F_LOG(log, "error", "id3forge: failed to write tag: " << status.message);
        return 1;
    }
    std::cout << "Wrote: " << dest << "\n";
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "ID3Forge " << ID3FORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--frame-flags") {
            cli.frame_flags = true;
        } else if (arg == "-H" || arg == "--human-readable") {
            cli.human_readable = true;
        } else if (arg == "--json") {
            cli.json = true;
        } else if ((arg == "--index" || arg == "-i") && i + 1 < argc) {
            cli.index = parse_index(argv[++i]);
            if (!cli.index) {
                std::cerr << "Invalid frame index: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            cli.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            cli.output_path = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            cli.positional.emplace_back(std::move(arg));
        }
    }

    id3forge::Logger log;
    id3forge::Config config;
    if (!id3forge::apply_environment(config, log, cli.config_path.value_or(""))) {
        return 2;
    }
    if (cli.log_level) {
        auto level = id3forge::log_verbosity_from_string(*cli.log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << *cli.log_level << "\n";
            return 2;
        }
        config.log_level = *level;
    }
    log.set_verbosity(config.log_level);

    if (cli.positional.size() < 2) {
        print_usage();
        return 2;
    }
    const std::string command = cli.positional[0];
    const std::string file = cli.positional[1];

    const size_t expected = command == "read"     ? 2
                            : command == "delete" ? 3
                            : (command == "write" || command == "edit") ? 4
                                                                        : 0;
    if (expected == 0) {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 2;
    }
    if (cli.positional.size() != expected) {
        std::cerr << "Invalid arguments for " << command << ". See --help for usage.\n";
        return 2;
    }

    const uint32_t user_index = cli.index.value_or(1);
    if (command != "read") {
        if (!validate_frame_id(cli.positional[2], log)) {
            return 2;
        }
        if (user_index == 0) {
            ID3F_LOG(log, "error", "the frame index starts at one, not zero");
            return 2;
        }
    }

    id3forge::TagFile tag(log, config.tag);
    const auto opened = tag.open(file);
    if (!opened.ok) {
        ID3F_LOG(log, "error", "id3forge: failed to read tag: " << opened.message);
        return 1;
    }

    if (command == "read") {
        if (cli.json) {
            std::cout << id3forge::tag_to_json(tag) << "\n";
        } else {
            std::cout << tag.render(cli.frame_flags, cli.human_readable) << "\n";
        }
        return 0;
    }

    const std::string &frame_id = cli.positional[2];
    if (command == "write") {
        const auto added = tag.add(frame_id, cli.positional[3]);
        if (!added.ok) {
            ID3F_LOG(log, "error", "id3forge: " << added.message);
            return 1;
        }
        return finish_write(tag, cli, log);
    }

    const uint32_t occurrence = user_index - 1;
    id3forge::FrameLookup hit;
    if (command == "edit") {
        hit = tag.edit(frame_id, occurrence, cli.positional[3]);
    } else {
        ID3F_LOG(log, "info", "removing the " << user_index << id3forge::ordinal_suffix(user_index)
                                              << " frame of id \"" << frame_id << "\"");
        hit = tag.remove(frame_id, occurrence);
    }
    if (!hit.found) {
        ID3F_LOG(log, "error",
                 id3forge::lookup_failure_message(frame_id, user_index, hit.match_count,
                                                  command == "edit" ? "edit" : "remove"));
        return 1;
    }
    return finish_write(tag, cli, log);
}
