#include <gtest/gtest.h>

#include "helpers/PathUtils.hpp"

TEST(PathUtils, CanonicalPath) {
    const std::vector<std::pair<std::string, std::string>> CASES = {
        {"", "/"},
        {"/", "/"},
        {"///", "/"},
        {"/api/data", "/api/data"},
        {"api/data", "/api/data"},
        {"/api//data/", "/api/data"},
        {"/API/Data", "/api/data"},
        {"/api/data?x=1&y=2", "/api/data"},
        {"/api/data#frag", "/api/data"},
        {"/api/data/?q#f", "/api/data"},
        {"?only=query", "/"},
    };

    for (const auto& [in, out] : CASES) {
        EXPECT_EQ(NPathUtils::canonicalPath(in), out) << in;
    }
}

TEST(PathUtils, CanonicalPathIsIdempotent) {
    for (const std::string p : {"/a//B/", "x", "/q?z", "//"}) {
        const auto ONCE = NPathUtils::canonicalPath(p);
        EXPECT_EQ(NPathUtils::canonicalPath(ONCE), ONCE);
    }
}

TEST(PathUtils, CanonicalMethod) {
    EXPECT_EQ(NPathUtils::canonicalMethod("get"), "GET");
    EXPECT_EQ(NPathUtils::canonicalMethod("Post"), "POST");
    EXPECT_EQ(NPathUtils::canonicalMethod("DELETE"), "DELETE");
    EXPECT_EQ(NPathUtils::canonicalMethod(""), "");
}
