#include "spiffe_id.hpp"
#include <gtest/gtest.h>
#include <unordered_set>

using svidsource::errc;
using svidsource::spiffe_id;
using svidsource::trust_domain;

TEST(trust_domain, parse_bare_name) {
    auto td = trust_domain::parse("example.org");
    ASSERT_TRUE(td.ok());
    EXPECT_EQ(td.value().name(), "example.org");
    EXPECT_EQ(td.value().id_string(), "spiffe://example.org");
}

TEST(trust_domain, parse_from_spiffe_id) {
    auto td = trust_domain::parse("spiffe://example.org/workload");
    ASSERT_TRUE(td.ok());
    EXPECT_EQ(td.value().name(), "example.org");
}

TEST(trust_domain, rejects_invalid_names) {
    EXPECT_EQ(trust_domain::parse("").code(), errc::invalid_argument);
    EXPECT_EQ(trust_domain::parse("Example.org").code(), errc::invalid_argument);
    EXPECT_EQ(trust_domain::parse("exa mple.org").code(), errc::invalid_argument);
    EXPECT_EQ(trust_domain::parse("example.org:8080").code(), errc::invalid_argument);
    EXPECT_EQ(trust_domain::parse("https://example.org").code(), errc::invalid_argument);
}

TEST(trust_domain, equality_and_hash) {
    auto a = trust_domain::parse("example.org").value();
    auto b = trust_domain::parse("spiffe://example.org").value();
    auto c = trust_domain::parse("domain.test").value();

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);

    std::unordered_set<trust_domain> set{a, b, c};
    EXPECT_EQ(set.size(), 2u);
}

TEST(spiffe_id, parse_valid) {
    auto id = spiffe_id::parse("spiffe://example.org/ns/prod/sa/web-1_a.b");
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(id.value().member_of().name(), "example.org");
    EXPECT_EQ(id.value().path(), "/ns/prod/sa/web-1_a.b");
    EXPECT_EQ(id.value().str(), "spiffe://example.org/ns/prod/sa/web-1_a.b");
}

TEST(spiffe_id, parse_without_path) {
    auto id = spiffe_id::parse("spiffe://example.org");
    ASSERT_TRUE(id.ok());
    EXPECT_TRUE(id.value().path().empty());
    EXPECT_EQ(id.value().str(), "spiffe://example.org");
}

TEST(spiffe_id, parse_invalid) {
    EXPECT_EQ(spiffe_id::parse("").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("example.org/workload").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("http://example.org/workload").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe:///workload").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://example.org/").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://example.org//a").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://example.org/a/../b").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://example.org/./a").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://example.org/a?x=1").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://example.org/a#frag").code(), errc::invalid_argument);
    EXPECT_EQ(spiffe_id::parse("spiffe://user@example.org/a").code(), errc::invalid_argument);
}

TEST(spiffe_id, from_path) {
    auto td = trust_domain::parse("example.org").value();

    auto id = spiffe_id::from_path(td, "/billing");
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(id.value().str(), "spiffe://example.org/billing");

    EXPECT_EQ(spiffe_id::from_path(td, "billing").code(), errc::invalid_argument);
}

TEST(spiffe_id, equality) {
    auto a = spiffe_id::parse("spiffe://example.org/a").value();
    auto b = spiffe_id::parse("spiffe://example.org/a").value();
    auto c = spiffe_id::parse("spiffe://example.org/b").value();
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
