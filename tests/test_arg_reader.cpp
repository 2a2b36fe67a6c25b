#include <gtest/gtest.h>
#include <cli/arg_reader.hpp>
#include <stdexcept>

TEST(ArgReader, FlagsAreConsumed) {
    ArgReader args({"--refresh", "123", "--refresh"});
    EXPECT_TRUE(args.flag({"--refresh"}));
    EXPECT_FALSE(args.flag({"--refresh"}));
    EXPECT_EQ(args.positionals(), (std::vector<std::string>{"123"}));
}

TEST(ArgReader, OptionsInBothForms) {
    ArgReader args({"--status", "RUNNING", "-s=PENDING", "--limit=5", "--tail", "20"});
    EXPECT_EQ(args.options({"--status", "-s"}), (std::vector<std::string>{"RUNNING", "PENDING"}));
    EXPECT_EQ(args.int_option({"--limit"}).value_or(-1), 5);
    EXPECT_EQ(args.int_option({"--tail", "-n"}).value_or(-1), 20);
    EXPECT_FALSE(args.int_option({"--head"}).has_value());
    EXPECT_TRUE(args.empty());
}

TEST(ArgReader, LastValueWins) {
    ArgReader args({"-b", "main", "--branch", "dev"});
    EXPECT_EQ(args.option({"--branch", "-b"}).value_or(""), "dev");
}

TEST(ArgReader, MissingValueIsValidationError) {
    ArgReader args({"job", "--tail"});
    EXPECT_THROW(args.int_option({"--tail"}), std::invalid_argument);
}

TEST(ArgReader, NegativeNumberRejected) {
    ArgReader args({"--limit", "-3"});
    EXPECT_THROW(args.int_option({"--limit"}), std::invalid_argument);

    ArgReader words({"--timeout", "soon"});
    EXPECT_THROW(words.int_option({"--timeout"}), std::invalid_argument);
}

TEST(ArgReader, UnknownOptionRejected) {
    ArgReader args({"123", "--bogus"});
    EXPECT_THROW(args.positionals(), std::invalid_argument);
}

TEST(ArgReader, SeparatorKeepsDashedPositionals) {
    ArgReader args({"--no-tunnel", "--", "-rf", "--not-an-option"});
    EXPECT_TRUE(args.flag({"--no-tunnel"}));
    EXPECT_EQ(args.positionals(), (std::vector<std::string>{"-rf", "--not-an-option"}));
}

TEST(ArgReader, TakeCommand) {
    ArgReader args({"add", "gpu", "https://gpu.example", "--port", "2222"});
    EXPECT_EQ(args.take_command().value_or(""), "add");
    EXPECT_EQ(args.int_option({"--port"}).value_or(0), 2222);
    EXPECT_EQ(args.positionals(), (std::vector<std::string>{"gpu", "https://gpu.example"}));

    ArgReader only_options({"-b", "gpu"});
    EXPECT_FALSE(only_options.take_command().has_value());
}
