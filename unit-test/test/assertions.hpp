#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "codejudge/common/json_utils.hpp"
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON，失败时输出两边的内容以及 JSON Patch 形式的差异
 * @param equal 期望两者相等还是不等
 */
inline ::testing::AssertionResult compareJson(bool equal,
                                              const char *lhs_expression, const char *rhs_expression,
                                              const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if ((lhs == rhs) == equal)
        return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << nlohmann::dump_lossy(lhs, 2) << std::endl
       << (equal ? "To be equal to: " : "Not to be equal to: ") << rhs_expression << std::endl
       << nlohmann::dump_lossy(rhs, 2) << std::endl;
    if (equal)
        ss << "      Difference: " << std::endl
           << nlohmann::dump_lossy(nlohmann::json::diff(lhs, rhs), 2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_TRUE(compareJson(true, #obj1, #obj2, obj1, obj2))

#define EXPECT_JSON_NE(obj1, obj2) \
    EXPECT_TRUE(compareJson(false, #obj1, #obj2, obj1, obj2))

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_TRUE(compareJson(true, #obj1, #obj2, obj1, obj2))
