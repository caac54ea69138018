#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <string>

namespace plexus::utils
{

class PLEXUS_MSG_EXPORT FileSink : public Sink
{
  public:
    /// Opens @p path for append. Throws std::runtime_error if it cannot be opened.
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::string m_path;
    std::FILE *m_file{nullptr};
};

} // namespace plexus::utils
