#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "storage/errors.hpp"
#include "storage/slotted_page.hpp"
#include "test_util.hpp"

class SlottedPageTest : public ::testing::Test {
protected:
    PageId pid{2, 0};
    std::vector<uint8_t> buf = std::vector<uint8_t>(4096, 0);

    SlottedPage make_page() { return SlottedPage(pid, buf.data(), buf.size(), EMPLOYEE_SIZE); }

    static std::vector<uint32_t> ids(SlottedPage& page) {
        std::vector<uint32_t> out;
        for (TupleView t : page) {
            out.push_back(employee_id(t));
        }
        return out;
    }
};


TEST_F(SlottedPageTest, InsertAndGet) {
    SlottedPage page = make_page();
    auto tid = page.insert_tuple(employee(1, 25));
    ASSERT_TRUE(tid.has_value());
    EXPECT_EQ(tid->tuple_index, 0);
    auto t = page.get_tuple(*tid);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(employee_age(*t), 25u);
    EXPECT_EQ(t->data(), buf.data() + page.header_size());

    page.put_tuple(*tid, employee(1, 28));
    EXPECT_EQ(employee_age(*page.get_tuple(*tid)), 28u);
    EXPECT_EQ(page.num_tuples(), 1u);
}

TEST_F(SlottedPageTest, FreedSlotIsReusedFirst) {
    SlottedPage page = make_page();
    auto t0 = page.insert_tuple(employee(10, 1));
    auto t1 = page.insert_tuple(employee(11, 1));
    auto t2 = page.insert_tuple(employee(12, 1));
    ASSERT_TRUE(t0 && t1 && t2);
    EXPECT_EQ(t1->tuple_index, 1);
    EXPECT_EQ(t2->tuple_index, 2);

    ASSERT_TRUE(page.delete_tuple(*t1));
    EXPECT_EQ(page.num_tuples(), 2u);
    EXPECT_FALSE(page.get_tuple(*t1).has_value());

    auto t3 = page.insert_tuple(employee(13, 1));
    ASSERT_TRUE(t3.has_value());
    EXPECT_EQ(t3->tuple_index, 1);
    EXPECT_EQ(employee_id(*page.get_tuple(*t0)), 10u);
    EXPECT_EQ(employee_id(*page.get_tuple(*t3)), 13u);
    EXPECT_EQ(employee_id(*page.get_tuple(*t2)), 12u);
}

TEST_F(SlottedPageTest, DeleteLeavesBytesInPlace) {
    SlottedPage page = make_page();
    for (uint32_t i = 0; i < 5; ++i) {
        page.insert_tuple(employee(i, 50 + i));
    }
    std::vector<uint8_t> before = buf;

    ASSERT_TRUE(page.delete_tuple(TupleId{pid, 2}));
    EXPECT_FALSE(page.delete_tuple(TupleId{pid, 2}));
    EXPECT_EQ(page.used_space(), 4u * 16);
    // Nothing moved: the tuple region is byte-identical, the deleted slot included.
    size_t region = page.header_size();
    EXPECT_EQ(std::memcmp(before.data() + region, buf.data() + region, buf.size() - region), 0);
    EXPECT_EQ(employee_id(*page.get_tuple(TupleId{pid, 3})), 3u);
}

TEST_F(SlottedPageTest, IterationSkipsHoles) {
    SlottedPage page = make_page();
    for (uint32_t i = 0; i < 4; ++i) {
        page.insert_tuple(employee(i, 1));
    }
    page.delete_tuple(TupleId{pid, 1});
    EXPECT_EQ(ids(page), (std::vector<uint32_t>{0, 2, 3}));
    EXPECT_EQ(ids(page), (std::vector<uint32_t>{0, 2, 3}));

    page.delete_tuple(TupleId{pid, 0});
    EXPECT_EQ(ids(page), (std::vector<uint32_t>{2, 3}));
    auto it = page.begin();
    EXPECT_EQ(it.index(), 2u);
    ++it;
    EXPECT_EQ(it.index(), 3u);
    ++it;
    EXPECT_TRUE(it == page.end());
}

TEST_F(SlottedPageTest, IteratesSlotsSetOutOfOrder) {
    SlottedPage page = make_page();
    page.header().set_slot(7);
    page.header().set_slot(200);
    page.put_tuple(TupleId{pid, 7}, employee(7, 0));
    page.put_tuple(TupleId{pid, 200}, employee(200, 0));
    EXPECT_EQ(ids(page), (std::vector<uint32_t>{7, 200}));
    EXPECT_TRUE(page.get_tuple(TupleId{pid, 200}).has_value());
    EXPECT_FALSE(page.get_tuple(TupleId{pid, 0}).has_value());
}

TEST_F(SlottedPageTest, ClearTupleKeepsSlotLive) {
    SlottedPage page = make_page();
    auto tid = page.insert_tuple(employee(1, 25));
    page.clear_tuple(*tid);
    auto t = page.get_tuple(*tid);
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(*t == Bytes(EMPLOYEE_SIZE, 0));
    EXPECT_EQ(page.num_tuples(), 1u);
}

TEST_F(SlottedPageTest, AbsentTuples) {
    SlottedPage page = make_page();
    page.insert_tuple(employee(1, 1));
    EXPECT_FALSE(page.get_tuple(TupleId{pid, -1}).has_value());
    EXPECT_FALSE(page.get_tuple(TupleId{pid, 1}).has_value());
    EXPECT_FALSE(page.get_tuple(TupleId{pid, 5000}).has_value());
    EXPECT_FALSE(page.delete_tuple(TupleId{pid, -3}));
    EXPECT_THROW(page.put_tuple(TupleId{pid, 253}, employee(1, 1)), std::out_of_range);
}

TEST_F(SlottedPageTest, FullPageRejectsInsert) {
    SlottedPage page = make_page();
    size_t inserted = 0;
    while (page.insert_tuple(employee(uint32_t(inserted), 1))) {
        ++inserted;
    }
    EXPECT_EQ(inserted, 253u);
    EXPECT_FALSE(page.has_free_tuple());
    EXPECT_EQ(page.free_space(), 0u);

    page.delete_tuple(TupleId{pid, 100});
    EXPECT_TRUE(page.has_free_tuple());
    auto tid = page.insert_tuple(employee(999, 1));
    ASSERT_TRUE(tid.has_value());
    EXPECT_EQ(tid->tuple_index, 100);
}

TEST_F(SlottedPageTest, DirtyFlagDiscipline) {
    SlottedPage page = make_page();
    EXPECT_FALSE(page.is_dirty());
    auto tid = page.insert_tuple(employee(1, 1));
    EXPECT_TRUE(page.is_dirty());
    page.set_dirty(false);
    page.put_tuple(*tid, employee(1, 2));
    EXPECT_TRUE(page.is_dirty());
    page.set_dirty(false);
    page.clear_tuple(*tid);
    EXPECT_TRUE(page.is_dirty());
    page.set_dirty(false);
    page.delete_tuple(*tid);
    EXPECT_TRUE(page.is_dirty());
}

TEST_F(SlottedPageTest, PackUnpackRoundTrip) {
    SlottedPage page = make_page();
    for (uint32_t i = 0; i < 12; ++i) {
        page.insert_tuple(employee(i, 40 + i));
    }
    page.delete_tuple(TupleId{pid, 3});
    page.delete_tuple(TupleId{pid, 8});
    Bytes packed = page.pack();
    ASSERT_EQ(packed.size(), 4096u);

    std::vector<uint8_t> copy(packed.begin(), packed.end());
    SlottedPage restored = SlottedPage::unpack(PageId{2, 5}, copy.data(), copy.size());
    EXPECT_EQ(restored.header(), page.header());
    EXPECT_EQ(restored.num_tuples(), 10u);
    EXPECT_EQ(ids(restored), ids(page));
    EXPECT_FALSE(restored.get_tuple(TupleId{PageId{2, 5}, 3}).has_value());
    EXPECT_EQ(restored.pack(), packed);

    // The freed slots survive the round trip as free.
    auto tid = restored.insert_tuple(employee(77, 0));
    ASSERT_TRUE(tid.has_value());
    EXPECT_EQ(tid->tuple_index, 3);
}

TEST_F(SlottedPageTest, RejectsWrongTupleWidth) {
    SlottedPage page = make_page();
    EXPECT_THROW(page.insert_tuple(Bytes(EMPLOYEE_SIZE - 1, 1)), InvalidConstruction);
    auto tid = page.insert_tuple(employee(4, 4));
    ASSERT_TRUE(tid.has_value());
    EXPECT_THROW(page.put_tuple(*tid, Bytes(EMPLOYEE_SIZE + 1, 1)), InvalidConstruction);
    EXPECT_EQ(page.num_tuples(), 1u);
    EXPECT_EQ(page.get_tuple(*tid)->to_bytes(), employee(4, 4));
}

TEST_F(SlottedPageTest, RejectsInvalidConstruction) {
    EXPECT_THROW(SlottedPage(pid, nullptr, 4096, EMPLOYEE_SIZE), InvalidConstruction);
    EXPECT_THROW(SlottedPage(pid, buf.data(), buf.size(), 0), InvalidConstruction);
    EXPECT_THROW(SlottedPage(pid, buf.data(), buf.size(), 5000), InvalidConstruction);
    EXPECT_THROW(SlottedPage::unpack(pid, buf.data(), buf.size()), StorageError);
}
