#include "http/router.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace squirrel::http;

//=============================================================================
// Path parsing
//=============================================================================

TEST(ParsePathTest, CollectionPath) {
    auto path = parse_path("/squirrels");
    EXPECT_EQ(path.resource, "squirrels");
    EXPECT_FALSE(path.id.has_value());
}

TEST(ParsePathTest, TrailingSlashHasNoId) {
    auto path = parse_path("/squirrels/");
    EXPECT_EQ(path.resource, "squirrels");
    EXPECT_FALSE(path.id.has_value());
}

TEST(ParsePathTest, ItemPath) {
    auto path = parse_path("/squirrels/123");
    EXPECT_EQ(path.resource, "squirrels");
    ASSERT_TRUE(path.id.has_value());
    EXPECT_EQ(*path.id, "123");
}

TEST(ParsePathTest, IdIsOpaque) {
    auto path = parse_path("/squirrels/abc");
    ASSERT_TRUE(path.id.has_value());
    EXPECT_EQ(*path.id, "abc");
}

TEST(ParsePathTest, ExtraSegmentsAreIgnored) {
    auto path = parse_path("/squirrels/7/nuts/");
    EXPECT_EQ(path.resource, "squirrels");
    ASSERT_TRUE(path.id.has_value());
    EXPECT_EQ(*path.id, "7");
}

TEST(ParsePathTest, EmptySecondSegmentMeansNoId) {
    auto path = parse_path("/squirrels//7");
    EXPECT_EQ(path.resource, "squirrels");
    EXPECT_FALSE(path.id.has_value());
}

TEST(ParsePathTest, RootAndEmpty) {
    EXPECT_EQ(parse_path("/").resource, "");
    EXPECT_FALSE(parse_path("/").id.has_value());
    EXPECT_EQ(parse_path("").resource, "");
    EXPECT_EQ(parse_path("squirrels").resource, "");
}

TEST(ParsePathTest, QueryStringIsPartOfSegment) {
    auto path = parse_path("/squirrels?sort=desc");
    EXPECT_EQ(path.resource, "squirrels?sort=desc");
    EXPECT_FALSE(path.id.has_value());

    auto item = parse_path("/squirrels/4?x=1#frag");
    EXPECT_EQ(item.resource, "squirrels");
    ASSERT_TRUE(item.id.has_value());
    EXPECT_EQ(*item.id, "4?x=1#frag");
}

TEST(ParsePathTest, EscapedSlashIsNotASeparator) {
    auto path = parse_path("/squirrels%2F1");
    EXPECT_EQ(path.resource, "squirrels%2F1");
    EXPECT_FALSE(path.id.has_value());
}

TEST(RouteRequestTest, QueryStringIsNotFound) {
    EXPECT_EQ(route_request("GET", "/squirrels?x=1").action, Action::NOT_FOUND);
    EXPECT_EQ(route_request("POST", "/squirrels?x=1").action, Action::NOT_FOUND);

    // The id keeps its query suffix and later fails record id parsing
    auto route = route_request("GET", "/squirrels/1?x");
    EXPECT_EQ(route.action, Action::RETRIEVE);
    EXPECT_EQ(route.resource_id, "1?x");
}

//=============================================================================
// Routing table
//=============================================================================

TEST(RouteRequestTest, GetRoutes) {
    EXPECT_EQ(route_request("GET", "/squirrels").action, Action::INDEX);
    EXPECT_EQ(route_request("GET", "/squirrels/").action, Action::INDEX);

    auto route = route_request("GET", "/squirrels/5");
    EXPECT_EQ(route.action, Action::RETRIEVE);
    EXPECT_EQ(route.resource_id, "5");
}

TEST(RouteRequestTest, PostRoutes) {
    EXPECT_EQ(route_request("POST", "/squirrels").action, Action::CREATE);
    EXPECT_EQ(route_request("POST", "/squirrels/").action, Action::CREATE);
    EXPECT_EQ(route_request("POST", "/squirrels/5").action, Action::NOT_FOUND);
}

TEST(RouteRequestTest, PutRoutes) {
    auto route = route_request("PUT", "/squirrels/5");
    EXPECT_EQ(route.action, Action::UPDATE);
    EXPECT_EQ(route.resource_id, "5");

    EXPECT_EQ(route_request("PUT", "/squirrels").action, Action::NOT_FOUND);
}

TEST(RouteRequestTest, DeleteRoutes) {
    auto route = route_request("DELETE", "/squirrels/abc");
    EXPECT_EQ(route.action, Action::DELETE);
    EXPECT_EQ(route.resource_id, "abc");

    EXPECT_EQ(route_request("DELETE", "/squirrels").action, Action::NOT_FOUND);
}

TEST(RouteRequestTest, PatchIsAlwaysMethodNotAllowed) {
    EXPECT_EQ(route_request("PATCH", "/squirrels").action, Action::METHOD_NOT_ALLOWED);
    EXPECT_EQ(route_request("PATCH", "/squirrels/1").action, Action::METHOD_NOT_ALLOWED);
    EXPECT_EQ(route_request("PATCH", "/acorns").action, Action::METHOD_NOT_ALLOWED);
    EXPECT_EQ(route_request("PATCH", "/").action, Action::METHOD_NOT_ALLOWED);
}

TEST(RouteRequestTest, UnknownResourceIsNotFound) {
    for (const std::string method : {"GET", "POST", "PUT", "DELETE"}) {
        EXPECT_EQ(route_request(method, "/acorns").action, Action::NOT_FOUND) << method;
        EXPECT_EQ(route_request(method, "/acorns/1").action, Action::NOT_FOUND) << method;
        EXPECT_EQ(route_request(method, "/").action, Action::NOT_FOUND) << method;
        EXPECT_EQ(route_request(method, "/Squirrels").action, Action::NOT_FOUND) << method;
    }
}

TEST(RouteRequestTest, OtherMethodsAreNotFound) {
    for (const std::string method : {"HEAD", "OPTIONS", "TRACE", "get"}) {
        EXPECT_EQ(route_request(method, "/squirrels").action, Action::NOT_FOUND) << method;
        auto route = route_request(method, "/squirrels/1");
        EXPECT_EQ(route.action, Action::NOT_FOUND) << method;
        EXPECT_TRUE(route.resource_id.empty());
    }
}

TEST(RouteRequestTest, ActionNames) {
    EXPECT_EQ(action_to_string(Action::INDEX), "index");
    EXPECT_EQ(action_to_string(Action::METHOD_NOT_ALLOWED), "method_not_allowed");
}
