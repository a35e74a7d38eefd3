#pragma once

#include <QtGlobal>

// Source of the live user count announced in discovery responses.
// Called from worker threads, implementations must be thread-safe.
class UserDirectory
{
public:
    virtual ~UserDirectory() = default;
    virtual quint32 onlineUsersCount() const = 0;
};
