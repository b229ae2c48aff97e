#pragma once
#include <tickloop/core/events/event.hpp>
#include <string>

namespace TickLoop {

/**
 * @class FileContentProvider
 * @brief Handler body returning a file's contents.
 *
 * A missing file is created with the placeholder text, which is then read
 * back and returned. I/O failures come back as "Error reading file: ..." or
 * "Error creating file: ..." strings; nothing is thrown.
 */
class FileContentProvider {
public:
    explicit FileContentProvider(std::string placeholder = "New file created")
        : placeholder_(std::move(placeholder)) {}

    std::string operator()(const std::string& path) const;

    Handler asHandler() const {
        return [provider = *this](const std::string& path) { return provider(path); };
    }

    const std::string& placeholder() const { return placeholder_; }

private:
    std::string createWithPlaceholder(const std::string& path) const;

    std::string placeholder_;
};

} // namespace TickLoop
