#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = autograder::scoped_guard() + [&]

namespace autograder {

/**
 * @brief 作用域守卫，离开作用域时执行清理函数
 * 评测流程中工作目录和镜像的清理都通过 defer 完成，确保任何退出路径（包括异常）都会执行清理。
 * @code{.cpp}
 *     filesystem::create_directories(dir);
 *     defer { filesystem::remove_all(dir); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理函数的执行
     */
    void dismiss();
};

}  // namespace autograder
