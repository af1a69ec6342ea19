// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
namespace AVEVA::BlobStream::Core
{
    /// <summary>
    /// Runs network operations inside a caller supplied wrapper, e.g. one that raises the
    /// permissions of the current thread for socket access.
    ///
    /// The wrapper must invoke the operation exactly once and let its exceptions through. Anything the
    /// wrapper throws itself must derive from std::exception.
    /// Without a wrapper operations are run directly.
    /// </summary>
    class PrivilegedExecutor
    {
    public:
        using Wrapper = std::function<void(const std::function<void()>&)>;

    private:
        Wrapper m_wrapper;

    public:
        PrivilegedExecutor() = default;
        explicit PrivilegedExecutor(Wrapper wrapper);

        bool IsPassThrough() const noexcept;

        template <typename Operation>
        std::invoke_result_t<Operation&> Run(Operation&& operation) const
        {
            using Result = std::invoke_result_t<Operation&>;
            if (!m_wrapper)
            {
                return operation();
            }

            if constexpr (std::is_void_v<Result>)
            {
                m_wrapper([&operation]() { operation(); });
            }
            else
            {
                std::optional<Result> result;
                m_wrapper([&operation, &result]() { result.emplace(operation()); });
                if (!result)
                {
                    throw std::logic_error("Privileged wrapper returned without running the operation");
                }

                return std::move(*result);
            }
        }
    };
}
