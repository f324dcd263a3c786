#include "GlobPattern/GlobPattern.hpp"

#include <algorithm>
#include <stdexcept>

namespace
{
constexpr char SegmentSeparator = '/';
constexpr std::string_view RecursiveSegment = "**";

/**
 * @brief Evaluate a bracket expression starting at pattern[start].
 *
 * @param[in] pattern Segment pattern
 * @param[in] start Index of the opening '['
 * @param[in] character Character being tested
 * @param[out] end Index just past the closing ']'
 * @param[out] matched Whether the character belongs to the class
 * @return false if the bracket is not terminated and must be taken literally
 */
bool MatchCharacterClass(std::string_view pattern, std::size_t start, char character, std::size_t& end, bool& matched)
{
    std::size_t index = start + 1;
    bool negate = false;
    if ((index < pattern.size()) && ('!' == pattern[index]))
    {
        negate = true;
        ++index;
    }

    const std::size_t first = index;
    // A ']' right after the opening (or after '!') is a member, not the terminator.
    if ((index < pattern.size()) && (']' == pattern[index]))
    {
        ++index;
    }
    while ((index < pattern.size()) && (']' != pattern[index]))
    {
        ++index;
    }
    if (index >= pattern.size())
    {
        return false;
    }

    const auto value = static_cast<unsigned char>(character);
    bool found = false;
    std::size_t position = first;
    while (position < index)
    {
        const auto low = static_cast<unsigned char>(pattern[position]);
        if (((position + 2) < index) && ('-' == pattern[position + 1]))
        {
            const auto high = static_cast<unsigned char>(pattern[position + 2]);
            if ((low <= value) && (value <= high))
            {
                found = true;
            }
            position += 3;
        }
        else
        {
            if (low == value)
            {
                found = true;
            }
            ++position;
        }
    }

    end = index + 1;
    matched = (true == negate) ? (false == found) : found;
    return true;
}
}

GlobPattern GlobPattern::Compile(const std::string& pattern)
{
    if (true == pattern.empty())
    {
        throw std::invalid_argument("Glob pattern must not be empty.");
    }
    if (SegmentSeparator == pattern.front())
    {
        throw std::invalid_argument("Glob pattern must be relative: " + pattern);
    }

    GlobPattern compiled;
    compiled._text = pattern;

    std::size_t segmentStart = 0;
    while (segmentStart <= pattern.size())
    {
        std::size_t segmentEnd = pattern.find(SegmentSeparator, segmentStart);
        if (std::string::npos == segmentEnd)
        {
            segmentEnd = pattern.size();
        }

        const std::string segment = pattern.substr(segmentStart, segmentEnd - segmentStart);
        segmentStart = segmentEnd + 1;

        if ((true == segment.empty()) || ("." == segment))
        {
            continue;
        }
        if (".." == segment)
        {
            throw std::invalid_argument("Glob pattern must not reference a parent directory: " + pattern);
        }

        const bool recursive = (RecursiveSegment == segment);
        if ((true == recursive) && (false == compiled._segments.empty()) && (true == compiled._segments.back().recursive))
        {
            continue;
        }
        compiled._segments.push_back({segment, recursive});
    }

    if (true == compiled._segments.empty())
    {
        throw std::invalid_argument("Glob pattern selects no entries: " + pattern);
    }

    compiled._directoriesOnly = (SegmentSeparator == pattern.back()) || (true == compiled._segments.back().recursive);
    return compiled;
}

bool GlobPattern::MatchSegment(std::string_view pattern, std::string_view name)
{
    // A leading dot is only matched by a literal dot.
    if ((false == name.empty()) && ('.' == name.front()) && ((true == pattern.empty()) || ('.' != pattern.front())))
    {
        return false;
    }

    std::size_t patternIndex = 0;
    std::size_t nameIndex = 0;
    std::size_t starPatternIndex = std::string_view::npos;
    std::size_t starNameIndex = 0;

    while (nameIndex < name.size())
    {
        if (patternIndex < pattern.size())
        {
            const char current = pattern[patternIndex];
            if ('*' == current)
            {
                starPatternIndex = ++patternIndex;
                starNameIndex = nameIndex;
                continue;
            }
            if ('?' == current)
            {
                ++patternIndex;
                ++nameIndex;
                continue;
            }
            if ('[' == current)
            {
                std::size_t classEnd = 0;
                bool classMatched = false;
                if (true == MatchCharacterClass(pattern, patternIndex, name[nameIndex], classEnd, classMatched))
                {
                    if (true == classMatched)
                    {
                        patternIndex = classEnd;
                        ++nameIndex;
                        continue;
                    }
                }
                else if ('[' == name[nameIndex])
                {
                    ++patternIndex;
                    ++nameIndex;
                    continue;
                }
            }
            else if (current == name[nameIndex])
            {
                ++patternIndex;
                ++nameIndex;
                continue;
            }
        }

        if (std::string_view::npos == starPatternIndex)
        {
            return false;
        }
        patternIndex = starPatternIndex;
        nameIndex = ++starNameIndex;
    }

    while ((patternIndex < pattern.size()) && ('*' == pattern[patternIndex]))
    {
        ++patternIndex;
    }
    return pattern.size() == patternIndex;
}

void GlobPattern::AddWithClosure(StateSet& states, std::size_t index) const
{
    const auto position = std::lower_bound(states.begin(), states.end(), index);
    if ((states.end() != position) && (index == *position))
    {
        return;
    }
    states.insert(position, index);

    // "**" may match zero levels, so the segment after it is reachable too.
    if ((index < _segments.size()) && (true == _segments[index].recursive))
    {
        AddWithClosure(states, index + 1);
    }
}

GlobPattern::StateSet GlobPattern::InitialStates() const
{
    StateSet states;
    AddWithClosure(states, 0);
    return states;
}

GlobPattern::StateSet GlobPattern::Advance(const StateSet& states, const std::string& name) const
{
    StateSet next;
    for (const std::size_t index : states)
    {
        if (index >= _segments.size())
        {
            continue;
        }

        const Segment& segment = _segments[index];
        if (true == segment.recursive)
        {
            AddWithClosure(next, index);
        }
        else if (true == MatchSegment(segment.text, name))
        {
            AddWithClosure(next, index + 1);
        }
    }
    return next;
}

bool GlobPattern::Accepts(const StateSet& states) const
{
    return std::binary_search(states.begin(), states.end(), _segments.size());
}

bool GlobPattern::CanDescend(const StateSet& states) const
{
    return (false == states.empty()) && (states.front() < _segments.size());
}

bool GlobPattern::MatchesDirectoriesOnly() const
{
    return _directoriesOnly;
}

bool GlobPattern::Matches(const fs::path& relativePath, bool isDirectory) const
{
    StateSet states = InitialStates();
    bool consumed = false;
    for (const auto& component : relativePath)
    {
        const std::string name = component.string();
        if ((true == name.empty()) || ("." == name))
        {
            continue;
        }

        states = Advance(states, name);
        consumed = true;
        if (true == states.empty())
        {
            return false;
        }
    }

    if (false == consumed)
    {
        return false;
    }
    return (true == Accepts(states)) && ((false == _directoriesOnly) || (true == isDirectory));
}

const std::string& GlobPattern::String() const
{
    return _text;
}
