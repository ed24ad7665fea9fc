#include <gtest/gtest.h>
#include <ledger/cli/options.hpp>

#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::optional<ledger::cli::options_t> parse(
    std::initializer_list<const char*> args,
    std::string& error) {
  auto argv = std::vector<const char*>{"ledger"};
  argv.insert(std::end(argv), args);
  return ledger::cli::parse_options(static_cast<int>(argv.size()), argv.data(),
                                    error);
}

}  // namespace

TEST(options, input_only_uses_defaults) {
  auto error = std::string{};
  auto options = parse({"transactions.csv"}, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->input_path, "transactions.csv");
  EXPECT_FALSE(options->output_path.has_value());
  EXPECT_EQ(options->log_level, spdlog::level::warn);
  EXPECT_FALSE(options->log_file.has_value());
  EXPECT_FALSE(options->show_help);
}

TEST(options, second_positional_is_output) {
  auto error = std::string{};
  auto options = parse({"in.csv", "out.csv"}, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->input_path, "in.csv");
  EXPECT_EQ(options->output_path, "out.csv");
}

TEST(options, output_flag_and_logging) {
  auto error = std::string{};
  auto options = parse({"-o", "accounts.csv", "--log-level", "debug",
                        "--log-file", "ledger.log", "in.csv"},
                       error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->input_path, "in.csv");
  EXPECT_EQ(options->output_path, "accounts.csv");
  EXPECT_EQ(options->log_level, spdlog::level::debug);
  EXPECT_EQ(options->log_file, "ledger.log");
}

TEST(options, log_level_off_is_accepted) {
  auto error = std::string{};
  auto options = parse({"-l", "off", "in.csv"}, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->log_level, spdlog::level::off);
}

TEST(options, unknown_log_level_is_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(parse({"-l", "loud", "in.csv"}, error).has_value());
  EXPECT_EQ(error, "unknown log level 'loud'");
}

TEST(options, missing_input_is_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(parse({}, error).has_value());
  EXPECT_EQ(error, "missing input path");
}

TEST(options, help_skips_input_check) {
  auto error = std::string{};
  auto options = parse({"--help"}, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_TRUE(options->show_help);
}

TEST(options, unknown_option_is_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(parse({"--verbose", "in.csv"}, error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(options, extra_positional_is_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(parse({"a.csv", "b.csv", "c.csv"}, error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(options, output_given_twice_is_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(parse({"in.csv", "out.csv", "-o", "other.csv"}, error)
                   .has_value());
  EXPECT_FALSE(error.empty());
}

TEST(options, description_lists_every_option) {
  auto text = std::ostringstream{};
  text << ledger::cli::make_description();
  const auto help = text.str();
  for (const auto* name : {"--help", "--output", "--log-level", "--log-file"}) {
    EXPECT_NE(help.find(name), std::string::npos) << name;
  }
  EXPECT_EQ(help.find("--input"), std::string::npos);
}
