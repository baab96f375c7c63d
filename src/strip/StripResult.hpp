#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace nbstripout
{

// A cell whose metadata says keep_output: false while its tags say "keep_output".
struct MetadataContradiction
{
    std::size_t cell_index = 0;           // position among surviving cells (per worksheet for legacy notebooks)
    std::optional<std::size_t> worksheet; // set for nbformat < 4
    std::optional<std::string> cell_id;   // nbformat >= 4.5 cell "id"

    [[nodiscard]] std::string message() const;
};

// Raised when the document does not have the shape the stripper expects.
class MalformedNotebookError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Outcome of a stripping pass. On success `document` holds the stripped value;
// on failure `error` names the offending cell and `document` is unspecified.
template<typename T>
struct StripResult
{
    T document;
    bool succeeded = true;
    std::optional<MetadataContradiction> error;

    static StripResult success(T doc)
    {
        StripResult res;
        res.document = std::move(doc);
        res.succeeded = true;
        return res;
    }

    static StripResult failure(MetadataContradiction err)
    {
        StripResult res;
        res.succeeded = false;
        res.error = std::move(err);
        return res;
    }

    explicit operator bool() const noexcept { return succeeded; }
};

} // namespace nbstripout
