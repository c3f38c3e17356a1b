#pragma once
#include <fstream>
#include <string>

namespace qdist {

// Append-only diagnostics file. Components take a nullable DiagLogger*;
// a null pointer means diagnostics are off.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    void log(const std::string& line);
    void log(const std::string& tag, const std::string& line);

private:
    std::ofstream out_;
};

} // namespace qdist
