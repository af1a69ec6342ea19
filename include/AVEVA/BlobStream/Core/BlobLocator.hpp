// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <ostream>
#include <string>
namespace AVEVA::BlobStream::Core
{
    /// <summary>
    /// Identifies a blob by the container it lives in and its name within that container.
    /// </summary>
    class BlobLocator
    {
        std::string m_container;
        std::string m_name;
    public:
        BlobLocator(std::string container, std::string name);

        const std::string& GetContainer() const noexcept;
        const std::string& GetName() const noexcept;
        std::string ToString() const;

        bool operator==(const BlobLocator& other) const = default;
    };

    std::ostream& operator<<(std::ostream& os, const BlobLocator& locator);
}
