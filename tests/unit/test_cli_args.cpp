// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for daemon command-line parsing
 */

#include "cli_args.h"

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <string>
#include <vector>

using namespace mediashelf;

namespace {

/// Owns mutable argv storage for parse_cli_args()
class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        storage_.emplace_back("mediashelf");
        for (const char* arg : args) {
            storage_.emplace_back(arg);
        }
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }

    char** argv() {
        return pointers_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool parse(std::initializer_list<const char*> args, CliArgs& out) {
    Argv argv(args);
    return parse_cli_args(argv.argc(), argv.argv(), out);
}

} // namespace

TEST_CASE("CliArgs: defaults", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({}, args));
    REQUIRE(args.config_path == "mediashelf.json");
    REQUIRE(args.verbosity == 0);
    REQUIRE(args.log_dest.empty());
    REQUIRE(args.log_file.empty());
    REQUIRE_FALSE(args.precache_only);
    REQUIRE_FALSE(args.no_watch);
}

TEST_CASE("CliArgs: config path", "[cli_args]") {
    CliArgs args;

    SECTION("short option") {
        REQUIRE(parse({"-c", "/etc/mediashelf.json"}, args));
        REQUIRE(args.config_path == "/etc/mediashelf.json");
    }

    SECTION("long option") {
        REQUIRE(parse({"--config", "conf.json"}, args));
        REQUIRE(args.config_path == "conf.json");
    }

    SECTION("long option with equals") {
        REQUIRE(parse({"--config=/opt/ms.json"}, args));
        REQUIRE(args.config_path == "/opt/ms.json");
    }

    SECTION("missing value") {
        REQUIRE_FALSE(parse({"--config"}, args));
    }
}

TEST_CASE("CliArgs: verbosity accumulates", "[cli_args]") {
    CliArgs args;

    SECTION("-v") {
        REQUIRE(parse({"-v"}, args));
        REQUIRE(args.verbosity == 1);
    }

    SECTION("-vv") {
        REQUIRE(parse({"-vv"}, args));
        REQUIRE(args.verbosity == 2);
    }

    SECTION("-vvv") {
        REQUIRE(parse({"-vvv"}, args));
        REQUIRE(args.verbosity == 3);
    }

    SECTION("repeated flags") {
        REQUIRE(parse({"-v", "--verbose", "-v"}, args));
        REQUIRE(args.verbosity == 3);
    }
}

TEST_CASE("CliArgs: log destination", "[cli_args]") {
    CliArgs args;

    for (const char* dest : {"auto", "journal", "syslog", "file", "console"}) {
        INFO(dest);
        CliArgs parsed;
        REQUIRE(parse({"--log-dest", dest}, parsed));
        REQUIRE(parsed.log_dest == dest);
    }

    SECTION("equals form with log file") {
        REQUIRE(parse({"--log-dest=file", "--log-file=/var/log/ms.log"}, args));
        REQUIRE(args.log_dest == "file");
        REQUIRE(args.log_file == "/var/log/ms.log");
    }

    SECTION("invalid destination") {
        REQUIRE_FALSE(parse({"--log-dest", "stdout"}, args));
    }

    SECTION("missing log file") {
        REQUIRE_FALSE(parse({"--log-file"}, args));
    }
}

TEST_CASE("CliArgs: operation flags", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"--precache", "--no-watch"}, args));
    REQUIRE(args.precache_only);
    REQUIRE(args.no_watch);
}

TEST_CASE("CliArgs: help and unknown arguments stop the program", "[cli_args]") {
    CliArgs args;
    REQUIRE_FALSE(parse({"--help"}, args));
    REQUIRE_FALSE(parse({"-h"}, args));
    REQUIRE_FALSE(parse({"--frobnicate"}, args));
    REQUIRE_FALSE(parse({"-x"}, args));
}
