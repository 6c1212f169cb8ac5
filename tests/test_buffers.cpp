#include <gtest/gtest.h>
#include "mybuf/buffers.hpp"

using namespace TftpWire;

TEST(BufferView, DefaultIsEmpty) {
    constexpr MyBuf::BufferView<unsigned char> view;

    EXPECT_TRUE(view.isEmpty());
    EXPECT_EQ(view.begin(), view.end());
    EXPECT_EQ(view.getLength(), 0UL);
}

TEST(BufferView, TakeAndDropFront) {
    const unsigned char raw[] = {1, 2, 3, 4};
    const MyBuf::BufferView<unsigned char> view {raw, sizeof(raw)};

    const auto front = view.takeFront(3);
    const auto back = view.dropFront(3);

    EXPECT_EQ(front.getLength(), 3UL);
    EXPECT_EQ(front[2], 3);
    EXPECT_EQ(back.getLength(), 1UL);
    EXPECT_EQ(back[0], 4);

    EXPECT_EQ(view.takeFront(10).getLength(), 4UL);
    EXPECT_TRUE(view.dropFront(4).isEmpty());
    EXPECT_TRUE(view.dropFront(9).isEmpty());
}

TEST(BufferView, ComparesContents) {
    const char lhs_raw[] = {'o', 'c', 't', 'e', 't'};
    const char rhs_raw[] = {'o', 'c', 't', 'e', 't'};
    const MyBuf::BufferView<char> lhs {lhs_raw, sizeof(lhs_raw)};
    const MyBuf::BufferView<char> rhs {rhs_raw, sizeof(rhs_raw)};

    EXPECT_TRUE(lhs == rhs);
    EXPECT_TRUE(lhs == std::string_view {"octet"});
    EXPECT_FALSE(lhs == std::string_view {"octets"});
    EXPECT_FALSE(lhs.takeFront(4) == rhs);
    EXPECT_TRUE(MyBuf::BufferView<char> {} == MyBuf::BufferView<char> {});
}

TEST(FixedBuffer, AppendsUntilFull) {
    MyBuf::FixedBuffer<unsigned char, 3> buffer;

    EXPECT_TRUE(buffer.isEmpty());
    EXPECT_TRUE(buffer.appendOctet(7));
    EXPECT_TRUE(buffer.appendOctet(8));
    EXPECT_TRUE(buffer.appendOctet(9));
    EXPECT_TRUE(buffer.isFull());
    EXPECT_FALSE(buffer.appendOctet(10));
    EXPECT_EQ(buffer.getLength(), 3UL);
    EXPECT_EQ(makeView(buffer)[2], 9);

    buffer.reset();

    EXPECT_TRUE(buffer.isEmpty());
    EXPECT_TRUE(makeView(buffer).isEmpty());
}

TEST(FixedBuffer, ViewsLogicalContents) {
    MyBuf::FixedBuffer<unsigned char, 8> buffer;
    ASSERT_TRUE(buffer.appendOctet(0));
    ASSERT_TRUE(buffer.appendOctet(4));

    const auto whole = makeView(buffer);

    EXPECT_EQ(whole.getLength(), 2UL);
    EXPECT_EQ(whole[0], 0);
    EXPECT_EQ(whole[1], 4);
    EXPECT_EQ(buffer.getSize(), 8UL);
}
