#pragma once

#include <QString>

#include <optional>
#include <utility>

namespace rinkguide {
namespace schedule {

// Outcome of one stage of a source fetch (transport, payload parse).
template <typename T>
class StageResult
{
public:
    static StageResult success(T value)
    {
        StageResult result;
        result.m_value = std::move(value);
        return result;
    }

    static StageResult failure(QString error)
    {
        StageResult result;
        result.m_error = std::move(error);
        return result;
    }

    bool ok() const { return m_value.has_value(); }
    const T &value() const { return *m_value; }
    T takeValue() { return std::move(*m_value); }
    const QString &error() const { return m_error; }

private:
    StageResult() = default;

    std::optional<T> m_value;
    QString m_error;
};

} // namespace schedule
} // namespace rinkguide
