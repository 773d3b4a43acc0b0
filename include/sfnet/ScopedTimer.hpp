#pragma once
#ifndef SFNET_SCOPEDTIMER_HPP
#define SFNET_SCOPEDTIMER_HPP

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace sfnet {

//! Measures wall time since construction; reports it on destruction if a label was given.
class ScopedTimer {
    using clock = std::chrono::steady_clock;

public:
    ScopedTimer() : begin_(clock::now()) {}

    explicit ScopedTimer(std::string label) : label_(std::move(label)), begin_(clock::now()) {}

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

    ~ScopedTimer() {
        if (!label_.empty())
            std::cout << label_ << " took " << elapsed() << "ms\n";
    }

    //! milliseconds since construction
    [[nodiscard]] double elapsed() const {
        return std::chrono::duration<double, std::milli>(clock::now() - begin_).count();
    }

private:
    std::string label_;
    clock::time_point begin_;
};

}

#endif // SFNET_SCOPEDTIMER_HPP
