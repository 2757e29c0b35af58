// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/core.h>
#include <lyra/lyra.hpp>

#include "rings/config.hpp"
#include "rings/focus_ring.hpp"
#include "rings/format.hpp"
#include "rings/multi_select_ring.hpp"
#include "rings/select_ring.hpp"

// Replays a sequence of navigation and selection commands on a ring of strings and prints the
// ring after each step.

struct trace_config {
    std::string kind = "focus";
    std::vector<std::string> items;
    std::vector<std::string> commands;
    bool quiet = false;
};

struct command {
    std::string name;
    std::string arg;
    bool has_arg;
};

command parse_command(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return {text, "", false};
    }
    return {text.substr(0, colon), text.substr(colon + 1), true};
}

int index_arg(const command& cmd) {
    if (!cmd.has_arg) {
        throw std::invalid_argument{"command '" + cmd.name + "' needs an index"};
    }
    try {
        std::size_t used = 0;
        int value = std::stoi(cmd.arg, &used);
        if (used != cmd.arg.size()) {
            throw std::invalid_argument{cmd.arg};
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument{"invalid index '" + cmd.arg + "' for '" + cmd.name + "'"};
    }
}

const std::string& text_arg(const command& cmd) {
    if (!cmd.has_arg) {
        throw std::invalid_argument{"command '" + cmd.name + "' needs an argument"};
    }
    return cmd.arg;
}

template <typename Ring>
constexpr bool has_selection = !std::is_same_v<Ring, rings::focus_ring<std::string>>;

template <typename Ring>
constexpr bool has_multi_selection = std::is_same_v<Ring, rings::multi_select_ring<std::string>>;

template <typename Ring>
Ring apply_selection(const Ring& ring, const command& cmd) {
    if constexpr (has_selection<Ring>) {
        if (cmd.name == "select") {
            return ring.select_at(index_arg(cmd));
        } else if (cmd.name == "deselect") {
            return ring.deselect_at(index_arg(cmd));
        } else if (cmd.name == "toggle") {
            return ring.toggle_at(index_arg(cmd));
        } else if (cmd.name == "toggle-focused") {
            return ring.toggle_focused();
        } else if (cmd.name == "clear") {
            if constexpr (has_multi_selection<Ring>) {
                return ring.deselect_all();
            } else {
                return ring.clear_selected();
            }
        } else if (cmd.name == "select-all") {
            if constexpr (has_multi_selection<Ring>) {
                return ring.select_all();
            }
            throw std::invalid_argument{"'select-all' requires --kind multi"};
        }
        throw std::invalid_argument{"unknown command '" + cmd.name + "'"};
    } else {
        throw std::invalid_argument{"'" + cmd.name + "' is unknown or requires a selecting ring"};
    }
}

template <typename Ring>
Ring apply(const Ring& ring, const command& cmd) {
    if (cmd.name == "next") {
        return ring.focus_on_next();
    } else if (cmd.name == "prev") {
        return ring.focus_on_previous();
    } else if (cmd.name == "first") {
        return ring.focus_on_first();
    } else if (cmd.name == "last") {
        return ring.focus_on_last();
    } else if (cmd.name == "focus") {
        return ring.focus_on(index_arg(cmd));
    } else if (cmd.name == "find") {
        const auto& needle = text_arg(cmd);
        return ring.focus_on_next_matching([&](const std::string& x) { return x == needle; });
    } else if (cmd.name == "rfind") {
        const auto& needle = text_arg(cmd);
        return ring.focus_on_previous_matching([&](const std::string& x) { return x == needle; });
    } else if (cmd.name == "push") {
        return ring.push(text_arg(cmd));
    } else if (cmd.name == "prepend") {
        return ring.prepend({text_arg(cmd)});
    } else if (cmd.name == "remove") {
        return ring.remove_at(index_arg(cmd));
    } else if (cmd.name == "remove-focused") {
        return ring.remove_focused();
    }
    return apply_selection(ring, cmd);
}

template <typename Ring>
void trace(Ring ring, const trace_config& cfg) {
    if (!cfg.quiet) {
        fmt::print("{:>16}  {}\n", "", ring);
    }
    for (const auto& text : cfg.commands) {
        ring = apply(ring, parse_command(text));
        if (!cfg.quiet) {
            fmt::print("{:>16}  {}\n", text, ring);
        }
    }
    if (cfg.quiet) {
        fmt::print("{}\n", ring);
    }
}

void run(const trace_config& cfg) {
    if (cfg.kind == "focus") {
        trace(rings::focus_ring<std::string>::from_array(cfg.items), cfg);
    } else if (cfg.kind == "select") {
        trace(rings::select_ring<std::string>::from_array(cfg.items), cfg);
    } else if (cfg.kind == "multi") {
        trace(rings::multi_select_ring<std::string>::from_array(cfg.items), cfg);
    } else {
        throw std::invalid_argument{"unknown ring kind '" + cfg.kind + "'"};
    }
}

int main(int argc, char* argv[]) {
    trace_config cfg;
    bool show_help = false;
    bool show_version = false;

    auto const cli =                                                                  //
        lyra::help(show_help)                                                         //
        | lyra::opt(cfg.kind, "kind")["-k"]["--kind"]("focus, select or multi")       //
        | lyra::opt(cfg.commands, "command")["-c"]["--cmd"]("command to apply")       //
        | lyra::opt(cfg.quiet)["-q"]["--quiet"]("print only the final ring")          //
        | lyra::opt(show_version)["--version"]("print version and exit")              //
        | lyra::arg(cfg.items, "item")("ring elements");

    auto const result = cli.parse({argc, argv});

    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.errorMessage());
        std::exit(1);
    }

    if (show_help) {
        std::cout << cli << std::endl;
        std::exit(0);
    }

    if (show_version) {
        fmt::print("ring-trace {}\n", rings::version().full);
        std::exit(0);
    }

    try {
        run(cfg);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        std::exit(1);
    }
}
