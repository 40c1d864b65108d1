/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdlib>

#include <fmt/ranges.h>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "cli/tree.hpp"
#include "cli/try.hpp"

namespace lc::cli {
  inline bool isOption(const std::string &arg) {
    return arg.size() > 1 && arg[0] == '-';
  }

  /**
   * Parses options of one command level, leaving the rest of argv to
   * subcommands and positional arguments.
   * "--" ends options and is consumed.
   * @return first argument which is not an option of this level
   */
  inline Argv::const_iterator parseOptions(po::variables_map &vm,
                                           const Opts &opts,
                                           Argv::const_iterator it,
                                           Argv::const_iterator end) {
    po::parsed_options parsed{&opts};
    while (it != end && isOption(*it)) {
      if (*it == "--") {
        ++it;
        break;
      }
      // option with its value, up to the next option
      const auto next{std::find_if(it + 1, end, isOption)};
      const auto chunk{
          po::command_line_parser{Argv{it, next}}.options(opts).run()};
      auto consumed{0u};
      for (const auto &option : chunk.options) {
        // positional token, belongs to subcommand
        if (option.string_key.empty()) {
          break;
        }
        parsed.options.emplace_back(option);
        consumed += option.original_tokens.size();
      }
      if (consumed == 0) {
        break;
      }
      it += consumed;
    }
    po::store(parsed, vm);
    return it;
  }

  inline void printHelp(const std::vector<std::string> &cmds,
                        const Opts &opts,
                        const Tree &tree) {
    fmt::print("usage:\n  {} [options]{}\n",
               fmt::join(cmds, " "),
               tree.sub.empty() ? "" : " <command>");
    fmt::print("options:\n{}", fmt::streamed(opts));
    if (!tree.sub.empty()) {
      fmt::print("commands:\n");
      for (const auto &sub : tree.sub) {
        fmt::print("  {}\n", sub.first);
      }
    }
  }

  /**
   * Walks command tree by argv and runs the selected command.
   * @return process exit code
   */
  inline int run(std::string app, const Tree &root, const Argv &argv) {
    const Tree *tree{&root};
    std::vector<std::string> cmds{std::move(app)};
    const auto fail{[&](const std::string_view &what) {
      fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), what);
      return EXIT_FAILURE;
    }};
    ArgsMap argm;
    auto it{argv.cbegin()};
    while (true) {
      auto args{tree->args()};
      args.opts.add_options()("help,h", "print help");
      po::variables_map vm;
      try {
        it = parseOptions(vm, args.opts, it, argv.cend());
        if (vm.count("help") != 0) {
          printHelp(cmds, args.opts, *tree);
          return EXIT_SUCCESS;
        }
        po::notify(vm);
      } catch (const po::error &e) {
        return fail(e.what());
      }
      argm._.emplace(std::move(args._));
      if (it != argv.cend()) {
        const auto sub{tree->sub.find(*it)};
        if (sub != tree->sub.end()) {
          cmds.emplace_back(sub->first);
          tree = &sub->second;
          ++it;
          continue;
        }
      }
      if (!tree->run) {
        if (it != argv.cend()) {
          return fail(fmt::format("unknown command {}", *it));
        }
        printHelp(cmds, args.opts, *tree);
        return EXIT_FAILURE;
      }
      try {
        tree->run(argm, {it, argv.cend()});
        return EXIT_SUCCESS;
      } catch (const po::error &e) {
        return fail(e.what());
      } catch (const CliError &e) {
        return fail(e.what());
      }
    }
  }

  inline int run(std::string app,
                 const Tree &tree,
                 int argc,
                 const char *argv[]) {
    return run(std::move(app), tree, Argv{argv + 1, argv + argc});
  }
}  // namespace lc::cli
