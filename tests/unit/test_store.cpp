#include <gtest/gtest.h>
#include "oprops/errors.hpp"
#include "oprops/ordered_store.hpp"
#include "oprops/store_builder.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace oprops;

namespace {

bool case_insensitive_less(std::string_view a, std::string_view b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

} // namespace

class OrderedStoreTest : public ::testing::Test {
protected:
    OrderedStore store;

    void add_bca(OrderedStore& target) {
        target.set("b", "222");
        target.set("c", "333");
        target.set("a", "111");
    }

    std::string stored(const OrderedStore& source, const std::optional<std::string>& comment) {
        std::ostringstream out;
        source.store(out, comment);
        return out.str();
    }
};


// Basic access

TEST_F(OrderedStoreTest, StartsEmpty) {
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.keys().empty());
}

TEST_F(OrderedStoreTest, SetAndGetData) {
    store.set("key", "value");
    EXPECT_TRUE(store.contains("key"));
    auto value = store.get("key");
    EXPECT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value");
}

TEST_F(OrderedStoreTest, SetReturnsPreviousValue) {
    EXPECT_EQ(store.set("key", "old_value"), std::nullopt);
    EXPECT_EQ(store.set("key", "new_value"), "old_value");
    EXPECT_EQ(store.get("key"), "new_value");
}

TEST_F(OrderedStoreTest, RemoveData) {
    store.set("key", "value");
    EXPECT_EQ(store.remove("key"), "value");
    EXPECT_FALSE(store.get("key").has_value());
    EXPECT_FALSE(store.contains("key"));
    EXPECT_TRUE(store.empty());
}

TEST_F(OrderedStoreTest, RemoveNonExistentKeyReturnsNullopt) {
    EXPECT_EQ(store.remove("not_here"), std::nullopt);
}

TEST_F(OrderedStoreTest, GetWithoutDefault) {
    store.set("aaa", "111");
    EXPECT_EQ(store.get("aaa"), "111");
    EXPECT_EQ(store.get("bbb"), std::nullopt);

    store.set("bbb", std::nullopt);
    EXPECT_EQ(store.get("bbb"), std::nullopt);
}

TEST_F(OrderedStoreTest, GetWithDefault) {
    store.set("aaa", "111");
    EXPECT_EQ(store.get("aaa", "222"), "111");
    EXPECT_EQ(store.get("bbb", "222"), "222");

    store.set("bbb", std::nullopt);
    EXPECT_EQ(store.get("bbb", "222"), "222");
}

TEST_F(OrderedStoreTest, NullValueKeepsKeyPresent) {
    store.set("key", "value");
    EXPECT_EQ(store.set("key", std::nullopt), "value");
    EXPECT_TRUE(store.contains("key"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.get("key").has_value());
}


// Ordering

TEST_F(OrderedStoreTest, KeysFollowInsertionOrder) {
    add_bca(store);
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b", "c", "a"}));
}

TEST_F(OrderedStoreTest, CaseDistinctKeysAreSeparateEntries) {
    store.set("name", "bob");
    store.set("NAME", "ALICE");
    store.set("Name", "carol");

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"name", "NAME", "Name"}));
    EXPECT_EQ(store.get("NAME"), "ALICE");
}

TEST_F(OrderedStoreTest, ResettingKeyKeepsPosition) {
    add_bca(store);
    store.set("b", "999");
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(store.get("b"), "999");
}

TEST_F(OrderedStoreTest, KeysSnapshotIsIndependent) {
    add_bca(store);
    auto keys = store.keys();
    auto entries = store.entries();
    store.remove("c");
    store.set("d", "444");

    EXPECT_EQ(keys, (std::vector<std::string>{"b", "c", "a"}));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].key, "c");
    EXPECT_EQ(entries[1].value, "333");
}

TEST_F(OrderedStoreTest, ToStringKeepsOrder) {
    add_bca(store);
    EXPECT_EQ(store.to_string(), "{b=222, c=333, a=111}");

    std::ostringstream out;
    out << store;
    EXPECT_EQ(out.str(), "{b=222, c=333, a=111}");
}

TEST_F(OrderedStoreTest, ToStringShowsNullValues) {
    store.set("a", std::nullopt);
    EXPECT_EQ(store.to_string(), "{a=null}");
}

TEST_F(OrderedStoreTest, CustomComparatorOrdersKeys) {
    auto sorted = StoreBuilder{}.with_ordering(case_insensitive_less).build();
    add_bca(sorted);
    sorted.set("B", "bbb");

    EXPECT_EQ(sorted.keys(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(sorted.get("b"), "bbb");

    auto out = stored(sorted, std::nullopt);
    EXPECT_TRUE(out.ends_with("\na=111\nb=bbb\nc=333\n")) << out;
}


// Loading

TEST_F(OrderedStoreTest, LoadFromByteStreamKeepsOrder) {
    std::istringstream in{"b=222\nc=333\na=111\n"};
    store.load(in);

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(store.get("b"), "222");
    EXPECT_EQ(store.get("c"), "333");
    EXPECT_EQ(store.get("a"), "111");
    EXPECT_EQ(store.get("d"), std::nullopt);
}

TEST_F(OrderedStoreTest, LoadFromCharStreamKeepsOrder) {
    std::istringstream in{"b=222\nc=333\na=\xC3\xBC\n"};
    store.load(in, Encoding::Utf8);

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(store.get("a"), "\xC3\xBC");
}

TEST_F(OrderedStoreTest, LoadOverwritesExistingEntriesInPlace) {
    store.set("a", "old");
    store.set("z", "zzz");
    std::istringstream in{"b=222\na=111\n"};
    store.load(in);

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"a", "z", "b"}));
    EXPECT_EQ(store.get("a"), "111");
}

TEST_F(OrderedStoreTest, FailedLoadKeepsEarlierEntries) {
    std::istringstream in{"b=222\nc=\\u12\na=111\n"};
    EXPECT_THROW(store.load(in), FormatError);
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b"}));
}

TEST_F(OrderedStoreTest, LoadFromXmlKeepsOrder) {
    std::istringstream in{
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n"
        "<!DOCTYPE properties SYSTEM \"http://java.sun.com/dtd/properties.dtd\">\n"
        "<properties>\n"
        "  <entry key=\"b\">222</entry>\n"
        "  <entry key=\"c\">333</entry>\n"
        "  <entry key=\"a\">111</entry>\n"
        "</properties>\n"};
    store.load_xml(in);

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(store.get("b"), "222");
    EXPECT_EQ(store.get("c"), "333");
    EXPECT_EQ(store.get("a"), "111");
    EXPECT_EQ(store.get("d"), std::nullopt);
}


// Storing

TEST_F(OrderedStoreTest, StoreToByteStreamKeepsOrder) {
    add_bca(store);
    auto out = stored(store, std::nullopt);
    EXPECT_TRUE(out.ends_with("\nb=222\nc=333\na=111\n")) << out;
    EXPECT_EQ(out.front(), '#');
}

TEST_F(OrderedStoreTest, StoreToSinkKeepsOrder) {
    add_bca(store);
    StringSink sink;
    store.store(sink, std::nullopt, Encoding::Utf8);
    EXPECT_TRUE(sink.str().ends_with("\nb=222\nc=333\na=111\n")) << sink.str();
}

TEST_F(OrderedStoreTest, StoreWithoutSuppressionKeepsDateAfterComment) {
    add_bca(store);
    auto out = stored(store, "some comment");
    ASSERT_TRUE(out.starts_with("#some comment\n#")) << out;

    auto data = out.substr(out.find('\n', std::string{"#some comment\n"}.size()) + 1);
    EXPECT_EQ(data, "b=222\nc=333\na=111\n");
}

TEST_F(OrderedStoreTest, StoreWithNullValueFails) {
    store.set("a", "1");
    store.set("b", std::nullopt);
    std::ostringstream out;
    EXPECT_THROW(store.store(out, std::nullopt), InvalidState);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(OrderedStoreTest, StoreToFailedStreamThrowsIOError) {
    add_bca(store);
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(store.store(out, std::nullopt), IOError);
}

TEST_F(OrderedStoreTest, StoreToXmlKeepsOrder) {
    add_bca(store);
    std::ostringstream out;
    store.store_xml(out, "foo");

    EXPECT_EQ(out.str(),
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n"
        "<!DOCTYPE properties SYSTEM \"http://java.sun.com/dtd/properties.dtd\">\n"
        "<properties>\n"
        "<comment>foo</comment>\n"
        "<entry key=\"b\">222</entry>\n"
        "<entry key=\"c\">333</entry>\n"
        "<entry key=\"a\">111</entry>\n"
        "</properties>\n");
}

TEST_F(OrderedStoreTest, StoreToXmlWithCustomEncoding) {
    add_bca(store);
    std::ostringstream out;
    store.store_xml(out, "foo", "ISO-8859-1");

    EXPECT_EQ(out.str(),
        "<?xml version=\"1.0\" encoding=\"ISO-8859-1\" standalone=\"no\"?>\n"
        "<!DOCTYPE properties SYSTEM \"http://java.sun.com/dtd/properties.dtd\">\n"
        "<properties>\n"
        "<comment>foo</comment>\n"
        "<entry key=\"b\">222</entry>\n"
        "<entry key=\"c\">333</entry>\n"
        "<entry key=\"a\">111</entry>\n"
        "</properties>\n");
}


// Date suppression

class SuppressDateTest : public OrderedStoreTest {
protected:
    OrderedStore suppressed = StoreBuilder{}.with_suppress_date_in_comment(true).build();
};

TEST_F(SuppressDateTest, WithoutComment) {
    add_bca(suppressed);
    EXPECT_EQ(stored(suppressed, std::nullopt), "b=222\nc=333\na=111\n");
}

TEST_F(SuppressDateTest, EmptyStoreWithoutComment) {
    EXPECT_EQ(stored(suppressed, std::nullopt), "");
}

TEST_F(SuppressDateTest, WithComment) {
    add_bca(suppressed);
    EXPECT_EQ(stored(suppressed, "some comment"), "#some comment\nb=222\nc=333\na=111\n");
}

TEST_F(SuppressDateTest, EmptyStoreWithComment) {
    EXPECT_EQ(stored(suppressed, "some comment"), "#some comment\n");
}

TEST_F(SuppressDateTest, WithLongComment) {
    add_bca(suppressed);
    std::string comment = "this is a very long comment that needs to be added when storing the properties to a stream";
    EXPECT_EQ(stored(suppressed, comment), "#" + comment + "\nb=222\nc=333\na=111\n");
}

TEST_F(SuppressDateTest, WithMultiLineComment) {
    add_bca(suppressed);
    EXPECT_EQ(stored(suppressed, "line1\nline2"), "#line1\n#line2\nb=222\nc=333\na=111\n");
}

TEST_F(SuppressDateTest, WithCommentLinesStartingWithBang) {
    add_bca(suppressed);
    EXPECT_EQ(stored(suppressed, "line1\n!line2"), "#line1\n!line2\nb=222\nc=333\na=111\n");
    EXPECT_EQ(stored(suppressed, "x\n!y\nz"), "#x\n!y\n#z\nb=222\nc=333\na=111\n");
}

TEST_F(SuppressDateTest, CharStreamWithComment) {
    add_bca(suppressed);
    StringSink sink;
    suppressed.store(sink, "some comment", Encoding::Utf8);
    EXPECT_EQ(sink.str(), "#some comment\nb=222\nc=333\na=111\n");
}

TEST_F(SuppressDateTest, XmlIsUnaffected) {
    add_bca(suppressed);
    std::ostringstream out;
    suppressed.store_xml(out, std::nullopt);
    EXPECT_NE(out.str().find("<entry key=\"b\">222</entry>"), std::string::npos);
    EXPECT_EQ(out.str().find("<comment>"), std::string::npos);
}


// Round trips

TEST_F(OrderedStoreTest, TextRoundTripPreservesOrderAndValues) {
    store.set("zeta", "last letter");
    store.set(" lead", " spaced value  ");
    store.set("a=b", "c:d");
    store.set("\xC3\xBC" "ber", "\xE2\x82\xAC 5");
    store.set("multi", "line1\nline2\ttab");
    store.set("empty", "");

    std::stringstream buffer;
    store.store(buffer, "header");

    OrderedStore loaded;
    loaded.load(buffer);
    EXPECT_EQ(loaded, store);
    EXPECT_EQ(loaded.keys(), store.keys());
}

TEST_F(OrderedStoreTest, XmlRoundTripPreservesOrderAndValues) {
    store.set("b", "<tag> & \"quoted\"");
    store.set("a", "\xC3\xA9t\xC3\xA9");
    store.set("c", "");

    std::stringstream buffer;
    store.store_xml(buffer, "comment & more");

    OrderedStore loaded;
    loaded.load_xml(buffer);
    EXPECT_EQ(loaded, store);
}


// Interop, copies, equality

TEST_F(OrderedStoreTest, ToUnorderedMapCopiesEntries) {
    add_bca(store);
    store.set("n", std::nullopt);

    auto plain = store.to_unordered_map();
    EXPECT_EQ(plain.size(), 3u);
    EXPECT_EQ(plain.at("b"), "222");
    EXPECT_EQ(plain.at("c"), "333");
    EXPECT_EQ(plain.at("a"), "111");
    EXPECT_EQ(plain.count("n"), 0u);

    plain["b"] = "changed";
    EXPECT_EQ(store.get("b"), "222");
}

TEST_F(OrderedStoreTest, ListTruncatesLongValues) {
    store.set("short", "abc");
    store.set("long", std::string(50, 'x'));

    std::ostringstream out;
    store.list(out);
    EXPECT_EQ(out.str(),
        "-- listing properties --\n"
        "short=abc\n"
        "long=" + std::string(37, 'x') + "...\n");
}

TEST_F(OrderedStoreTest, CopyHasSameEntriesAndBehavior) {
    auto source = StoreBuilder{}
        .with_ordering(case_insensitive_less)
        .with_suppress_date_in_comment(true)
        .build();
    add_bca(source);

    auto copy = OrderedStore::copy_of(source);
    EXPECT_EQ(copy, source);
    EXPECT_TRUE(copy.suppress_date());
    EXPECT_EQ(copy.comparator(), source.comparator());

    copy.set("B", "changed");
    EXPECT_EQ(source.get("b"), "222");
    EXPECT_EQ(copy.get("b"), "changed");
}

TEST_F(OrderedStoreTest, CopyOfUnsortedStoreKeepsInsertionOrder) {
    add_bca(store);
    store.set("z", std::nullopt);

    auto copy = OrderedStore::copy_of(store);
    EXPECT_EQ(copy.comparator(), nullptr);
    EXPECT_FALSE(copy.suppress_date());
    EXPECT_EQ(copy.keys(), (std::vector<std::string>{"b", "c", "a", "z"}));
    EXPECT_TRUE(copy.contains("z"));

    copy.set("d", "4");
    EXPECT_EQ(copy.keys().back(), "d");
    EXPECT_FALSE(store.contains("d"));
}

TEST_F(OrderedStoreTest, EqualityIsOrderSensitive) {
    OrderedStore first;
    first.set("a", "1");
    first.set("b", "2");

    OrderedStore same;
    same.set("a", "1");
    same.set("b", "2");

    OrderedStore reversed;
    reversed.set("b", "2");
    reversed.set("a", "1");

    EXPECT_EQ(first, same);
    EXPECT_EQ(std::hash<OrderedStore>{}(first), std::hash<OrderedStore>{}(same));
    EXPECT_NE(first, reversed);

    same.set("b", std::nullopt);
    EXPECT_NE(first, same);
}

TEST_F(OrderedStoreTest, UsableAsHashSetKey) {
    add_bca(store);
    std::unordered_set<OrderedStore> set;
    set.insert(store);
    set.insert(OrderedStore::copy_of(store));
    EXPECT_EQ(set.size(), 1u);
}


// Concurrency: separate stores share nothing

TEST_F(OrderedStoreTest, ConcurrentLoadAndStoreOnSeparateStores) {
    const int num_threads = 8;
    const int ops_per_thread = 50;
    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    std::vector<OrderedStore> stores(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&stores, i]() {
            for (int j = 0; j < ops_per_thread; j++) {
                std::string id{std::to_string(i) + "_" + std::to_string(j)};
                std::istringstream in{"key_" + id + "=" + id + "value\n"};
                stores[i].load(in);

                std::ostringstream out;
                stores[i].store(out, std::nullopt);
                EXPECT_TRUE(out.str().ends_with("key_" + id + "=" + id + "value\n"));
            }
        });
    }
    for (auto& t : threads)
        t.join();

    for (int i = 0; i < num_threads; i++) {
        EXPECT_EQ(stores[i].size(), static_cast<std::size_t>(ops_per_thread));
        EXPECT_EQ(stores[i].keys().front(), "key_" + std::to_string(i) + "_0");
    }
}
