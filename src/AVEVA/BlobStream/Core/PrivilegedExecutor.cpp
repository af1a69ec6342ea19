// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/PrivilegedExecutor.hpp"
namespace AVEVA::BlobStream::Core
{
    PrivilegedExecutor::PrivilegedExecutor(Wrapper wrapper)
        : m_wrapper(std::move(wrapper))
    {
    }

    bool PrivilegedExecutor::IsPassThrough() const noexcept
    {
        return !m_wrapper;
    }
}
