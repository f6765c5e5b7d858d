#include "core/subtitle_parser.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "core/segmenter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{
    std::string trim(const std::string &s)
    {
        size_t begin = 0;
        while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])))
            ++begin;
        size_t end = s.size();
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
            --end;
        return s.substr(begin, end - begin);
    }

    std::string stripTags(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());
        bool in_tag = false;
        for (char c : text)
        {
            if (c == '<')
                in_tag = true;
            else if (c == '>' && in_tag)
                in_tag = false;
            else if (!in_tag)
                out.push_back(c);
        }
        return out;
    }

    bool allDigits(const std::string &s)
    {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c)
                                         { return std::isdigit(c) != 0; });
    }

    // Split on blank lines. Carriage returns and a leading UTF-8 BOM are dropped.
    std::vector<std::vector<std::string>> splitBlocks(const std::string &content)
    {
        std::vector<std::vector<std::string>> blocks;
        std::vector<std::string> current;
        std::istringstream in(content);
        std::string line;
        bool first = true;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (first && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
                line.erase(0, 3);
            first = false;

            if (trim(line).empty())
            {
                if (!current.empty())
                {
                    blocks.push_back(std::move(current));
                    current.clear();
                }
                continue;
            }
            current.push_back(line);
        }
        if (!current.empty())
            blocks.push_back(std::move(current));
        return blocks;
    }
}

std::optional<double> SubtitleParser::parseTimestamp(const std::string &text)
{
    std::string ts = trim(text);
    std::replace(ts.begin(), ts.end(), ',', '.');

    std::vector<std::string> parts;
    std::stringstream ss(ts);
    std::string part;
    while (std::getline(ss, part, ':'))
        parts.push_back(part);
    if (parts.size() < 2 || parts.size() > 3)
        return std::nullopt;

    // Seconds field: "SS" or "SS.mmm"
    const std::string &sec_field = parts.back();
    auto dot = sec_field.find('.');
    std::string whole = sec_field.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : sec_field.substr(dot + 1);
    if (!allDigits(whole) || (dot != std::string::npos && !allDigits(frac)))
        return std::nullopt;

    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        if (!allDigits(parts[i]))
            return std::nullopt;
    }

    double seconds = std::stod(sec_field);
    double minutes = std::stod(parts[parts.size() - 2]);
    double hours = parts.size() == 3 ? std::stod(parts[0]) : 0.0;
    if (minutes >= 60.0 || seconds >= 60.0)
        return std::nullopt;
    return hours * 3600.0 + minutes * 60.0 + seconds;
}

bool SubtitleParser::isSupportedFile(const std::string &file_path)
{
    std::string ext = FileUtils::lowercaseExtension(file_path);
    return ext == ".vtt" || ext == ".srt";
}

std::vector<SubtitleCue> SubtitleParser::parseFile(const std::string &file_path, const std::string &video_id)
{
    std::string ext = FileUtils::lowercaseExtension(file_path);
    if (ext != ".vtt" && ext != ".srt")
    {
        throw MalformedInputError("Unsupported subtitle format: " + file_path);
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open())
    {
        throw MalformedInputError("Cannot open subtitle file: " + file_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto cues = ext == ".vtt" ? parseVtt(buffer.str(), video_id) : parseSrt(buffer.str(), video_id);
    Logger::info("Parsed " + std::to_string(cues.size()) + " cues from " + file_path);
    return cues;
}

std::vector<SubtitleCue> SubtitleParser::parseVtt(const std::string &content, const std::string &video_id)
{
    return parseBlocks(content, video_id, true);
}

std::vector<SubtitleCue> SubtitleParser::parseSrt(const std::string &content, const std::string &video_id)
{
    return parseBlocks(content, video_id, false);
}

std::vector<SubtitleCue> SubtitleParser::parseBlocks(const std::string &content, const std::string &video_id, bool vtt)
{
    std::vector<SubtitleCue> cues;

    for (const auto &block : splitBlocks(content))
    {
        const std::string &head = block.front();
        if (vtt && (head.rfind("WEBVTT", 0) == 0 || head.rfind("NOTE", 0) == 0 ||
                    head.rfind("STYLE", 0) == 0 || head.rfind("REGION", 0) == 0))
        {
            continue;
        }

        // Timing line is the first or, after an identifier, the second line of the block
        size_t timing_line = block.size();
        for (size_t i = 0; i < block.size() && i < 2; ++i)
        {
            if (block[i].find("-->") != std::string::npos)
            {
                timing_line = i;
                break;
            }
        }
        if (timing_line == block.size())
        {
            if (vtt)
            {
                Logger::debug("Skipping WebVTT block without timing line: " + head);
                continue;
            }
            throw MalformedInputError("SubRip block without timing line", cues.size());
        }

        const std::string &timing = block[timing_line];
        auto arrow = timing.find("-->");
        std::string left = trim(timing.substr(0, arrow));
        std::string right = trim(timing.substr(arrow + 3));
        // Cue settings ("align:start position:10%") follow the end timestamp
        auto space = right.find_first_of(" \t");
        if (space != std::string::npos)
            right = right.substr(0, space);

        auto start = parseTimestamp(left);
        auto end = parseTimestamp(right);
        if (!start || !end)
        {
            throw MalformedInputError("Unparsable cue timing '" + timing + "'", cues.size());
        }
        if (*end < *start)
        {
            throw MalformedInputError("Cue ends before it starts", cues.size());
        }

        std::string text;
        for (size_t i = timing_line + 1; i < block.size(); ++i)
        {
            if (!text.empty())
                text += ' ';
            text += stripTags(block[i]);
        }

        SubtitleCue cue;
        cue.video_id = video_id;
        cue.start = *start;
        cue.end = *end;
        cue.text = Segmenter::normalizeWhitespace(text);

        if (cue.text.empty())
        {
            Logger::debug("Skipping empty cue at " + std::to_string(cue.start) + "s in video " + video_id);
            continue;
        }
        cues.push_back(std::move(cue));
    }
    return cues;
}

DirectorySubtitleSource::DirectorySubtitleSource(std::string directory)
    : directory_(std::move(directory))
{
}

std::optional<std::string> DirectorySubtitleSource::findSubtitleFile(const std::string &video_id) const
{
    for (const char *ext : {".vtt", ".srt"})
    {
        std::filesystem::path candidate = std::filesystem::path(directory_) / (video_id + ext);
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
            return candidate.string();
    }
    return std::nullopt;
}

std::vector<SubtitleCue> DirectorySubtitleSource::cuesFor(const std::string &video_id)
{
    auto file = findSubtitleFile(video_id);
    if (!file)
    {
        throw MalformedInputError("No subtitle file for video " + video_id + " in " + directory_);
    }
    return SubtitleParser::parseFile(*file, video_id);
}
