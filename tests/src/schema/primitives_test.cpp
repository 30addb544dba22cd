#include <agentid/schema/primitives.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

TEST(primitives, to_hex_is_lower_case) {
  auto bytes = agentid::schema::bytes_t{0x00, 0x0f, 0xab, 0xff};
  EXPECT_EQ(agentid::schema::to_hex(agentid::schema::make_bytes_view(bytes)),
            "000fabff");
  EXPECT_EQ(agentid::schema::to_hex(agentid::schema::bytes_view_t{}), "");
}

TEST(primitives, string_and_byte_views_share_storage) {
  auto text = std::string{"AID|credential"};
  auto view = agentid::schema::make_bytes_view(text);
  EXPECT_EQ(view.size(), text.size());
  EXPECT_EQ(static_cast<const void*>(view.data()),
            static_cast<const void*>(text.data()));

  auto copy = agentid::schema::make_bytes(std::string_view{text});
  EXPECT_EQ(agentid::schema::make_string(copy), text);
  EXPECT_EQ(agentid::schema::make_string_view(copy), text);
}
