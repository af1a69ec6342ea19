// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/BlobLocator.hpp"
namespace AVEVA::BlobStream::Core
{
    BlobLocator::BlobLocator(std::string container, std::string name)
        : m_container(std::move(container)),
        m_name(std::move(name))
    {
    }

    const std::string& BlobLocator::GetContainer() const noexcept
    {
        return m_container;
    }

    const std::string& BlobLocator::GetName() const noexcept
    {
        return m_name;
    }

    std::string BlobLocator::ToString() const
    {
        return m_container + "/" + m_name;
    }

    std::ostream& operator<<(std::ostream& os, const BlobLocator& locator)
    {
        return os << locator.GetContainer() << '/' << locator.GetName();
    }
}
