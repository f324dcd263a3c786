#pragma once

#include <cstddef>
#include <ostream>

/**
 * @brief Receiver of progress signals for a run over a known number of items.
 */
class ProgressSink
{
  public:
    virtual ~ProgressSink() = default;

    /**
     * @brief Begin a run.
     *
     * @param[in] total Number of items expected
     */
    virtual void Open(std::size_t total) = 0;

    /**
     * @brief Record that one more item has been processed.
     */
    virtual void Increment() = 0;

    /**
     * @brief End the run, however it ended.
     */
    virtual void Close() = 0;
};

/**
 * @brief Progress sink that ignores every signal.
 */
class NullProgressSink : public ProgressSink
{
  public:
    void Open(std::size_t) override
    {
    }
    void Increment() override
    {
    }
    void Close() override
    {
    }
};

/**
 * @brief Progress sink writing one line per signal to a stream.
 */
class ConsoleProgressSink : public ProgressSink
{
  public:
    /**
     * @brief Construct a console sink.
     *
     * @param[in] outputStream Stream receiving progress lines
     * @param[in] stage Label printed in front of every line
     */
    explicit ConsoleProgressSink(std::ostream& outputStream, const char* stage = "loading");

    void Open(std::size_t total) override;
    void Increment() override;
    void Close() override;

  private:
    std::ostream& _outputStream;
    const char* _stage;
    std::size_t _processed;
    std::size_t _total;
};

/**
 * @brief Scoped acquisition of a progress sink.
 *
 * Opens the sink on construction and closes it on destruction.
 */
class ProgressScope
{
  public:
    ProgressScope(ProgressSink& progressSink, std::size_t total);
    ~ProgressScope();

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

    void Increment();

  private:
    ProgressSink& _progressSink;
};
