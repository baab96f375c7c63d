#pragma once

#include <functional>
#include <string>

namespace nbstripout
{

/**
 * @brief Side channel for non-fatal problems found while stripping
 *
 * The stripping core never logs on its own. Callers install a callback to
 * route warnings to plog, stderr, or a test capture:
 *
 *   WarningContext ctx;
 *   ctx.SetCallback([](const std::string& message) { PLOG_WARNING << message; });
 *   auto result = stripCellFormat(std::move(nb), config, &ctx);
 */
using WarningCallback = std::function<void(const std::string&)>;

class WarningContext
{
public:
    WarningContext() = default;
    explicit WarningContext(WarningCallback callback)
        : callback_(std::move(callback))
    {
    }

    void SetCallback(WarningCallback callback)
    {
        callback_ = std::move(callback);
    }

    void ReportWarning(const std::string& message) const
    {
        if (callback_)
            callback_(message);
    }

    bool HasCallback() const
    {
        return static_cast<bool>(callback_);
    }

private:
    WarningCallback callback_;
};

} // namespace nbstripout
