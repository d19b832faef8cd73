#include "doctest_compatibility.h"

#include "autoinst/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

TEST_CASE("Split test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto tokens = autoinst::utils::make_multiline_view(input, false, ',');
    REQUIRE_EQ(tokens.size(), 0U);
  }
  SECTION("single delim string view")
  {
    static constexpr auto input = ","sv;
    const auto tokens = autoinst::utils::make_multiline_view(input, false, ',');
    REQUIRE_EQ(tokens.size(), 0U);
  }
  SECTION("short string view")
  {
    static constexpr auto input = "1,22,333"sv;
    const auto tokens = autoinst::utils::make_multiline_view(input, false, ',');
    REQUIRE_EQ(input.data(), tokens[0].data());
    REQUIRE_EQ(tokens.size(), 3U);
    REQUIRE_EQ(tokens[0], "1");
    REQUIRE_EQ(tokens[1], "22");
    REQUIRE_EQ(tokens[2], "333");
  }
  SECTION("reversed lines")
  {
    static constexpr auto input = "pacstrap\ngenfstab\nbootctl"sv;
    const auto lines = autoinst::utils::make_multiline(input, true);
    REQUIRE_EQ(lines, std::vector<std::string>{"bootctl", "genfstab", "pacstrap"});
  }
}

TEST_CASE("join test")
{
  SECTION("empty vector")
  {
    const std::vector<std::string> input{};
    REQUIRE_EQ(autoinst::utils::join(input), "");
  }
  SECTION("package list")
  {
    const std::vector<std::string> input{"base", "linux", "linux-firmware"};
    REQUIRE_EQ(autoinst::utils::join(input, ' '), "base linux linux-firmware");
  }
  SECTION("groups list")
  {
    const std::vector<std::string> input{"wheel", "audio", "video"};
    REQUIRE_EQ(autoinst::utils::join(input, ','), "wheel,audio,video");
  }
}

TEST_CASE("trim and lower test")
{
  SECTION("trim whitespace")
  {
    REQUIRE_EQ(autoinst::utils::trim("  yes \n"sv), "yes"sv);
    REQUIRE_EQ(autoinst::utils::trim("\t\t"sv), ""sv);
    REQUIRE_EQ(autoinst::utils::trim(""sv), ""sv);
    REQUIRE_EQ(autoinst::utils::trim("y"sv), "y"sv);
  }
  SECTION("lowercase")
  {
    REQUIRE_EQ(autoinst::utils::to_lower("YeS"sv), "yes");
    REQUIRE_EQ(autoinst::utils::to_lower("/dev/SDA1"sv), "/dev/sda1");
  }
}

TEST_CASE("shell quote test")
{
  SECTION("plain word")
  {
    REQUIRE_EQ(autoinst::utils::shell_quote("stable"sv), "'stable'");
  }
  SECTION("password hash keeps dollars literal")
  {
    REQUIRE_EQ(autoinst::utils::shell_quote("$6$salt$hash"sv), "'$6$salt$hash'");
  }
  SECTION("embedded single quotes")
  {
    REQUIRE_EQ(autoinst::utils::shell_quote("['<Ctrl>F12']"sv), R"('['\''<Ctrl>F12'\'']')");
  }
}
