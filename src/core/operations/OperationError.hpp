#pragma once

#include <QString>
#include <stdexcept>

namespace srt {

/// Raised by workflow steps for failures that are reported verbatim to the UI.
/// Anything else escaping a step is treated as an internal error.
class OperationError : public std::runtime_error {
public:
    enum class Category {
        User,           // nothing to do, bad input; no retry makes sense
        Collaborator    // git, AI provider, filesystem, subprocess failed
    };

    OperationError(Category category, const QString& message)
        : std::runtime_error(message.toStdString())
        , category_(category)
        , message_(message)
    {
    }

    static OperationError user(const QString& message)
    {
        return OperationError(Category::User, message);
    }

    static OperationError collaborator(const QString& message)
    {
        return OperationError(Category::Collaborator, message);
    }

    Category category() const { return category_; }
    QString message() const { return message_; }

private:
    Category category_;
    QString message_;
};

/// Raised at a checkpoint once the operation's token is set.
class OperationCancelled : public std::exception {
public:
    const char* what() const noexcept override { return "operation cancelled"; }
};

} // namespace srt
