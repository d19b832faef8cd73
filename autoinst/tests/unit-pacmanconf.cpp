#include "doctest_compatibility.h"

#include "autoinst/file_utils.hpp"
#include "autoinst/logger.hpp"
#include "autoinst/pacmanconf_repo.hpp"
#include "autoinst/repos.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto CUSTOM_REPO_SECTION_TEST = R"([repo]
SigLevel = Optional TrustAll
Server = https://repo.heili.eu/$arch)"sv;

static constexpr auto MIRRORLIST_TEST = R"(##
## Arch Linux repository mirrorlist
## Generated on 2024-05-01
##

## Worldwide
#Server = https://geo.mirror.pkgbuild.com/$repo/os/$arch
#Server = https://mirror.rackspace.com/archlinux/$repo/os/$arch

## Germany
  Server = https://ftp.fau.de/archlinux/$repo/os/$arch
Server = https://mirror.f4st.host/archlinux/$repo/os/$arch
)"sv;

TEST_CASE("mirrorlist test")
{
    SECTION("first active server")
    {
        REQUIRE_EQ(autoinst::repos::find_first_server(MIRRORLIST_TEST), "https://ftp.fau.de/archlinux/$repo/os/$arch");
    }
    SECTION("everything commented out")
    {
        REQUIRE(!autoinst::repos::find_first_server("#Server = https://geo.mirror.pkgbuild.com/$repo/os/$arch\n"sv).has_value());
        REQUIRE(!autoinst::repos::find_first_server(""sv).has_value());
    }
    SECTION("keys other than Server")
    {
        REQUIRE(!autoinst::repos::find_first_server("ServerOverride = https://example.org\nServer =\n"sv).has_value());
    }
}

TEST_CASE("pacman conf test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    autoinst::logger::set_logger(logger);

    static constexpr std::string_view filename{"/tmp/autoinst-pacman.conf"};
    fs::copy_file(AUTOINST_TEST_DIR "/files/pacman.conf", filename, fs::copy_options::overwrite_existing);

    const autoinst::repos::CustomRepo custom_repo{
        .name      = "repo",
        .server    = "https://repo.heili.eu/$arch",
        .sig_level = "Optional TrustAll",
    };

    SECTION("get current repos")
    {
        auto repo_list = autoinst::detail::pacmanconf::get_repo_list(filename);
        REQUIRE((repo_list == std::vector<std::string>{"[core]", "[extra]"}));
    }
    SECTION("repo section")
    {
        REQUIRE_EQ(autoinst::repos::gen_repo_section(custom_repo), CUSTOM_REPO_SECTION_TEST);
    }
    SECTION("expand server url")
    {
        REQUIRE_EQ(autoinst::repos::expand_server_url(custom_repo), "https://repo.heili.eu/x86_64");

        const autoinst::repos::CustomRepo mirror_repo{.name = "extra", .server = "https://geo.mirror.pkgbuild.com/$repo/os/$arch"};
        REQUIRE_EQ(autoinst::repos::expand_server_url(mirror_repo), "https://geo.mirror.pkgbuild.com/extra/os/x86_64");
    }
    SECTION("add custom repo once")
    {
        REQUIRE(autoinst::repos::add_custom_repo(custom_repo, filename));
        const auto& content_first = autoinst::file_utils::read_whole_file(filename);
        REQUIRE(content_first.ends_with(std::string{CUSTOM_REPO_SECTION_TEST} + '\n'));

        REQUIRE(autoinst::repos::add_custom_repo(custom_repo, filename));
        const auto& content_second = autoinst::file_utils::read_whole_file(filename);
        REQUIRE_EQ(content_first, content_second);

        auto repo_list = autoinst::detail::pacmanconf::get_repo_list(filename);
        REQUIRE((repo_list == std::vector<std::string>{"[core]", "[extra]", "[repo]"}));
    }
    SECTION("enable multilib once")
    {
        REQUIRE(autoinst::repos::enable_multilib(filename));
        const auto& content_first = autoinst::file_utils::read_whole_file(filename);
        REQUIRE(content_first.contains("\n[multilib]\nInclude = /etc/pacman.d/mirrorlist\n\n"sv));
        // testing repo and the commented example stay untouched
        REQUIRE(content_first.contains("#[multilib-testing]\n#Include = /etc/pacman.d/mirrorlist\n"sv));
        REQUIRE(content_first.contains("#[custom]\n#SigLevel = Optional TrustAll\n"sv));

        REQUIRE(autoinst::repos::enable_multilib(filename));
        const auto& content_second = autoinst::file_utils::read_whole_file(filename);
        REQUIRE_EQ(content_first, content_second);

        auto repo_list = autoinst::detail::pacmanconf::get_repo_list(filename);
        REQUIRE((repo_list == std::vector<std::string>{"[core]", "[extra]", "[multilib]"}));
    }
    SECTION("missing repo to uncomment")
    {
        REQUIRE(!autoinst::detail::pacmanconf::uncomment_repo(filename, "community"sv));
    }
    SECTION("missing file")
    {
        REQUIRE(!autoinst::repos::add_custom_repo(custom_repo, "/tmp/autoinst-does-not-exist.conf"sv));
        REQUIRE(!autoinst::repos::enable_multilib("/tmp/autoinst-does-not-exist.conf"sv));
    }

    // Cleanup.
    fs::remove(filename);
}
