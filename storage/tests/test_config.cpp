#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "storage/config.hpp"
#include "storage/errors.hpp"
#include "storage/log.hpp"

TEST(ConfigTest, PageLayoutNames) {
    EXPECT_EQ(page_layout_from_string("contiguous"), PageLayout::Contiguous);
    EXPECT_EQ(page_layout_from_string("Slotted"), PageLayout::Slotted);
    EXPECT_EQ(page_layout_from_string("SLOTTED"), PageLayout::Slotted);
    EXPECT_STREQ(to_string(PageLayout::Contiguous), "contiguous");
    EXPECT_STREQ(to_string(PageLayout::Slotted), "slotted");
    EXPECT_THROW(page_layout_from_string("heap"), UnsupportedOperation);
}

TEST(ConfigTest, Validation) {
    BufferPoolConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.page_size, DEFAULT_PAGE_SIZE);
    EXPECT_EQ(config.pool_size, DEFAULT_POOL_SIZE);

    config.pool_size = config.page_size - 1;
    EXPECT_THROW(config.validate(), InvalidConstruction);

    config.pool_size = DEFAULT_POOL_SIZE;
    config.page_size = MAX_PAGE_SIZE + 1;
    EXPECT_THROW(config.validate(), InvalidConstruction);

    config.page_size = 0;
    EXPECT_THROW(config.validate(), InvalidConstruction);
}

TEST(LogTest, StreamLoggerFiltersByLevel) {
    std::ostringstream out;
    log_callback_t log = make_stream_logger(out, LogLevel::Warn);
    log(LogLevel::Debug, "quiet");
    log(LogLevel::Info, "still quiet");
    log(LogLevel::Warn, "careful");
    log(LogLevel::Error, "broken");
    EXPECT_EQ(out.str(), "[warn] careful\n[error] broken\n");
}
