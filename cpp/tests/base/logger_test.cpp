#include <gtest/gtest.h>
#include "capture_adapter.hpp"

#include "../../base/base.hpp"

#include <map>
#include <string>

TEST(LoggerTest, formats_and_dispatches) {
    auto adapter = std::make_shared<capture_adapter>();
    base::initialize(adapter);
    base::log_info(base::log_channel::codec, "decoded {} values in {} bytes", 3, 12);
    base::log_debug(base::log_channel::stream, "plain");
    base::deinitialize();

    ASSERT_EQ(2u, adapter->records.size());
    EXPECT_EQ(base::log_level::info, adapter->records[0].level);
    EXPECT_EQ("codec", adapter->records[0].channel);
    EXPECT_EQ("decoded 3 values in 12 bytes", adapter->records[0].message);
    EXPECT_EQ("stream", adapter->records[1].channel);
}

TEST(LoggerTest, params_are_appended) {
    base::logger l;
    auto adapter = std::make_shared<capture_adapter>();
    l.add(adapter);
    const std::map<std::string, std::string, std::less<>> params{{"a", "1"}, {"b", "2"}};
    l.log(base::log_level::error, "generic", "failed", params);
    ASSERT_EQ(1u, adapter->records.size());
    EXPECT_EQ("failed [a=1, b=2]", adapter->records[0].message);

    l.remove("capture");
    EXPECT_TRUE(l.empty());
}

TEST(LoggerTest, level_names) {
    EXPECT_EQ(base::log_level::warning, base::str_to_log_level("warn"));
    EXPECT_EQ(base::log_level::debug, base::str_to_log_level("DEBUG"));
    EXPECT_FALSE(base::str_to_log_level("verbose").has_value());
    EXPECT_EQ("error", base::log_level_to_str(base::log_level::error));
}

TEST(LoggerTest, default_adapter_is_installed_lazily) {
    base::deinitialize();
    EXPECT_FALSE(base::is_initialized());
    EXPECT_FALSE(base::get_logger().empty());
    EXPECT_TRUE(base::is_initialized());
}

namespace {

class errors_only_adapter : public capture_adapter {
public:
    bool accepts(base::log_level level) const override {
        return level == base::log_level::error;
    }
};

}

TEST(LoggerTest, adapters_filter_levels) {
    base::logger l;
    auto all = std::make_shared<capture_adapter>();
    auto errors = std::make_shared<errors_only_adapter>();
    l.add(all);
    l.add(errors);

    const int bytes = 12;
    const std::string operation = "decode";
    l.log(base::log_level::info, "codec", "{} bytes", fmt::make_format_args(bytes));
    l.log(base::log_level::error, "codec", "{} failed", fmt::make_format_args(operation));

    EXPECT_EQ(2u, all->records.size());
    ASSERT_EQ(1u, errors->records.size());
    EXPECT_EQ("decode failed", errors->records[0].message);
}
