#include "common/defer.hpp"

namespace runner {
using namespace std;

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}
scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (f) f();
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

}  // namespace runner
