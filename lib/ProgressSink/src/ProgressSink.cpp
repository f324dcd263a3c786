#include "ProgressSink/ProgressSink.hpp"

ConsoleProgressSink::ConsoleProgressSink(std::ostream& outputStream, const char* stage)
    : _outputStream(outputStream), _stage(stage), _processed(0), _total(0)
{
}

void ConsoleProgressSink::Open(std::size_t total)
{
    _processed = 0;
    _total = total;
    _outputStream << "[" << _stage << "] " << _processed << "/" << _total << '\n';
}

void ConsoleProgressSink::Increment()
{
    ++_processed;
    _outputStream << "[" << _stage << "] " << _processed << "/" << _total << '\n';
}

void ConsoleProgressSink::Close()
{
    _outputStream << "[" << _stage << "] done " << _processed << "/" << _total << '\n';
    _outputStream.flush();
}

ProgressScope::ProgressScope(ProgressSink& progressSink, std::size_t total) : _progressSink(progressSink)
{
    _progressSink.Open(total);
}

ProgressScope::~ProgressScope()
{
    _progressSink.Close();
}

void ProgressScope::Increment()
{
    _progressSink.Increment();
}
