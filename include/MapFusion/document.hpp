#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace MapFusion {

// Shared by the text bridges (yyjson.hpp, yaml.hpp)
enum class DocumentError {
    NO_ERROR,
    ILLFORMED_DOCUMENT,
    UNSUPPORTED_VALUE,
    WRITER_ERROR
};

constexpr std::string_view document_error_to_string(DocumentError e) {
    switch(e) {
    case DocumentError::NO_ERROR: return "NO_ERROR"; break;
    case DocumentError::ILLFORMED_DOCUMENT: return "ILLFORMED_DOCUMENT"; break;
    case DocumentError::UNSUPPORTED_VALUE: return "UNSUPPORTED_VALUE"; break;
    case DocumentError::WRITER_ERROR: return "WRITER_ERROR"; break;
    }
    return "N/A";
}

class DocumentResult {
    DocumentError m_error = DocumentError::NO_ERROR;
    std::size_t m_pos = 0;
    std::string m_message;
public:
    DocumentResult() = default;
    DocumentResult(DocumentError err, std::size_t pos = 0, std::string message = {}):
        m_error(err), m_pos(pos), m_message(std::move(message))
    {}

    operator bool() const {
        return m_error == DocumentError::NO_ERROR;
    }
    DocumentError error() const {
        return m_error;
    }
    // Byte offset of a read error, when the backend reports one
    std::size_t pos() const {
        return m_pos;
    }
    const std::string & message() const {
        return m_message;
    }
};

} // namespace MapFusion
