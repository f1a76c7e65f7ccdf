#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = runner::scoped_guard() + [&]

namespace runner {

/**
 * @brief 在作用域结束时执行清理函数
 * 配合 defer 宏使用：defer { curl_easy_cleanup(curl); };
 * 清理函数不允许抛出异常
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace runner
