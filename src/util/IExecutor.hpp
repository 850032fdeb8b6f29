#pragma once
#include <functional>

namespace aforge
{
    struct IExecutor
    {
        virtual ~IExecutor() = default;
        virtual void post(std::function<void()> fn) = 0;
    };
}
