#include <string>

#include <bes/besexcept.hpp>

#include "util/pprintf.hpp"

#include "common.hpp"

using namespace std::string_literals;
using namespace bes::util;

TEST(pprintf, placeholders) {
    EXPECT_EQ("", pprintf(""));
    EXPECT_EQ("no placeholders", pprintf("no placeholders"));
    EXPECT_EQ("cell 3 of 10", pprintf("cell {} of {}", 3, 10));
    EXPECT_EQ("channel leak_k", pprintf("channel {}", "leak_k"s));
    EXPECT_EQ("{} 0.5", pprintf("{{}} {}", 0.5));
}

TEST(pprintf, exception_messages) {
    bes::unknown_channel_error e("kdr");
    EXPECT_EQ("no channel kdr in catalogue", std::string(e.what()));
    EXPECT_EQ("kdr", e.channel_name);

    bes::connectivity_error c(7, "no gap junction");
    EXPECT_EQ("connectivity error on cell 7: no gap junction", std::string(c.what()));
    EXPECT_EQ(7u, c.cell);

    EXPECT_EQ("invalid parameters: dt", std::string(bes::bad_parameters("dt").what()));
}
