#pragma once

#include <functional>

#define CODEJUDGE_DEFER_1(x, y) x##y
#define CODEJUDGE_DEFER_2(x, y) CODEJUDGE_DEFER_1(x, y)
#define CODEJUDGE_DEFER_0(x) CODEJUDGE_DEFER_2(x, __COUNTER__)
#define defer auto CODEJUDGE_DEFER_0(_defered_option) = codejudge::scoped_guard() + [&]

namespace codejudge {

/**
 * @brief 作用域结束时执行回调，配合 defer 宏使用
 * @code{.cpp}
 *     defer { std::filesystem::remove_all(workdir, ec); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace codejudge
