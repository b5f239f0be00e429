#ifndef DESTINATION_SINK_HPP
#define DESTINATION_SINK_HPP

#include <cstdint>
#include <fstream>
#include <string>

// Where a transfer materializes an object's bytes. Writes always arrive in
// object order; the engine never interleaves two chunks.
class DestinationSink {
public:
    virtual ~DestinationSink() = default;

    // Prepares the sink to receive bytes starting at `resume_offset`. Returns the
    // offset it can actually continue from (0 when it has nothing to resume).
    virtual std::uint64_t Open(std::uint64_t resume_offset) = 0;

    virtual void Write(const std::string& data) = 0;

    // Called at every chunk boundary.
    virtual void Flush() = 0;

    // MD5 hex over everything written, including resumed bytes.
    virtual std::string Checksum() = 0;

    // Publishes the content at Location().
    virtual void Commit() = 0;

    // Drops all partial state.
    virtual void Discard() = 0;

    // Stops writing but keeps the partial state for a later resume.
    virtual void Release() = 0;

    virtual bool SupportsResume() const = 0;

    virtual std::string Location() const = 0;
};

// Streams into "<path>.part" and renames it over <path> on commit.
class FileSink : public DestinationSink {
public:
    explicit FileSink(std::string path);
    ~FileSink() override;

    std::uint64_t Open(std::uint64_t resume_offset) override;
    void Write(const std::string& data) override;
    void Flush() override;
    std::string Checksum() override;
    void Commit() override;
    void Discard() override;
    void Release() override;
    bool SupportsResume() const override { return true; }
    std::string Location() const override { return path_; }

    std::string PartPath() const { return path_ + ".part"; }

private:
    std::string path_;
    std::ofstream out_;
};

// Collects the object in memory, for inline reads.
class MemorySink : public DestinationSink {
public:
    std::uint64_t Open(std::uint64_t resume_offset) override;
    void Write(const std::string& data) override;
    void Flush() override {}
    std::string Checksum() override;
    void Commit() override {}
    void Discard() override;
    void Release() override { Discard(); }
    bool SupportsResume() const override { return false; }
    std::string Location() const override { return "memory"; }

    const std::string& Data() const { return data_; }

private:
    std::string data_;
};

#endif // DESTINATION_SINK_HPP
