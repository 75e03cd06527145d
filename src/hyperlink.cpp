/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "hyperlink.h"
#include "config.h"
#include "util/log.h"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

namespace textvault {

namespace {

    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }

    std::string_view trim_end(std::string_view s) {
        size_t n = s.size();
        while (n > 0 && is_space(s[n - 1])) --n;
        return s.substr(0, n);
    }

    // Locate the last complete trailer. Returns false when there is none.
    bool find_trailer(std::string_view text, size_t* start, size_t* json_begin, size_t* json_end) {
        const std::string_view start_marker(MetadataTrailerExtractor::kStartMarker);
        const std::string_view end_marker(MetadataTrailerExtractor::kEndMarker);

        size_t s = text.rfind(start_marker);
        if (s == std::string_view::npos) return false;

        size_t jb = s + start_marker.size();
        size_t e = text.find(end_marker, jb);
        if (e == std::string_view::npos) return false;

        *start = s;
        *json_begin = jb;
        *json_end = e;
        return true;
    }

    void drop_out_of_bounds(std::vector<Hyperlink>& links, size_t content_len) {
        links.erase(std::remove_if(links.begin(), links.end(),
                                   [content_len](const Hyperlink& h) {
                                       return h.start_index < 0 || h.length < 0 ||
                                              static_cast<uint64_t>(h.end_index()) > content_len;
                                   }),
                    links.end());
    }

} // namespace

// ---------------------------------------------------------------------------
// MetadataTrailerExtractor
// ---------------------------------------------------------------------------

std::string MetadataTrailerExtractor::to_json(const std::vector<Hyperlink>& links) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& link : links) {
        writer.StartObject();
        writer.Key("start");
        writer.Int64(link.start_index);
        writer.Key("length");
        writer.Int(link.length);
        writer.Key("url");
        writer.String(link.url.c_str(), static_cast<rapidjson::SizeType>(link.url.size()));
        writer.Key("text");
        writer.String(link.display_text.c_str(), static_cast<rapidjson::SizeType>(link.display_text.size()));
        writer.EndObject();
    }
    writer.EndArray();

    return std::string(buffer.GetString(), buffer.GetSize());
}

bool MetadataTrailerExtractor::from_json(std::string_view json, std::vector<Hyperlink>* out) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        debug() << "Hyperlink metadata parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }

    if (!doc.IsArray()) {
        debug() << "Hyperlink metadata is not an array";
        return false;
    }

    std::vector<Hyperlink> links;
    links.reserve(doc.Size());
    for (rapidjson::SizeType i = 0; i < doc.Size(); i++) {
        const auto& obj = doc[i];
        if (!obj.IsObject()) return false;

        if (!obj.HasMember("start") || !obj["start"].IsInt64()) return false;
        if (!obj.HasMember("length") || !obj["length"].IsInt()) return false;
        if (!obj.HasMember("url") || !obj["url"].IsString()) return false;

        Hyperlink link;
        link.start_index = obj["start"].GetInt64();
        link.length = obj["length"].GetInt();
        link.url.assign(obj["url"].GetString(), obj["url"].GetStringLength());
        if (obj.HasMember("text") && obj["text"].IsString()) {
            link.display_text.assign(obj["text"].GetString(), obj["text"].GetStringLength());
        }
        links.push_back(std::move(link));
    }

    *out = std::move(links);
    return true;
}

std::string MetadataTrailerExtractor::remove_metadata(std::string_view content) {
    size_t start, jb, je;
    if (!find_trailer(content, &start, &jb, &je)) {
        return std::string(content);
    }
    return std::string(trim_end(content.substr(0, start)));
}

Extraction MetadataTrailerExtractor::extract(std::string_view text) const {
    Extraction result;

    size_t start, jb, je;
    if (!find_trailer(text, &start, &jb, &je)) {
        result.clean_text.assign(text.data(), text.size());
        return result;
    }

    std::vector<Hyperlink> links;
    if (!from_json(text.substr(jb, je - jb), &links)) {
        result.clean_text.assign(text.data(), text.size());
        return result;
    }

    std::string_view clean = trim_end(text.substr(0, start));
    drop_out_of_bounds(links, clean.size());

    result.clean_text.assign(clean.data(), clean.size());
    result.hyperlinks = std::move(links);
    return result;
}

std::string MetadataTrailerExtractor::embed(std::string_view content,
                                            const std::vector<Hyperlink>& links) const {
    std::string clean = remove_metadata(content);
    if (links.empty()) {
        return clean;
    }

    std::string json = to_json(links);
    std::string out;
    out.reserve(clean.size() + json.size() + 32);
    out.append(clean);
    out.append(files::kLineEnding);
    out.append(files::kLineEnding);
    out.append(kStartMarker);
    out.append(json);
    out.append(kEndMarker);
    return out;
}

// ---------------------------------------------------------------------------
// UrlPatternExtractor
// ---------------------------------------------------------------------------

namespace {

    bool starts_with_icase(std::string_view s, size_t pos, const char* prefix) {
        size_t n = std::strlen(prefix);
        if (pos + n > s.size()) return false;
        for (size_t i = 0; i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(s[pos + i])) != prefix[i]) return false;
        }
        return true;
    }

    bool is_url_char(char c) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7F) return false;
        switch (c) {
            case '<': case '>': case '"': case '\'': case '`':
            case '{': case '}': case '|': case '\\': case '^':
                return false;
            default:
                return true;
        }
    }

    bool is_word_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/';
    }

} // namespace

Extraction UrlPatternExtractor::extract(std::string_view text) const {
    Extraction result;
    result.clean_text.assign(text.data(), text.size());

    size_t i = 0;
    while (i < text.size()) {
        size_t prefix_len = 0;
        bool needs_scheme = false;
        char c = text[i];
        if (c == 'h' || c == 'H') {
            if (starts_with_icase(text, i, "https://")) prefix_len = 8;
            else if (starts_with_icase(text, i, "http://")) prefix_len = 7;
        } else if (c == 'w' || c == 'W') {
            if (starts_with_icase(text, i, "www.")) {
                prefix_len = 4;
                needs_scheme = true;
            }
        }

        if (prefix_len == 0 || (i > 0 && is_word_char(text[i - 1]))) {
            ++i;
            continue;
        }

        size_t end = i + prefix_len;
        while (end < text.size() && is_url_char(text[end])) ++end;

        // Trailing sentence punctuation is not part of the link
        while (end > i + prefix_len) {
            char last = text[end - 1];
            if (last == '.' || last == ',' || last == ';' || last == ':' ||
                last == '!' || last == '?' || last == ')' || last == ']') {
                if (last == ')') {
                    std::string_view body = text.substr(i, end - i);
                    if (std::count(body.begin(), body.end(), '(') >= std::count(body.begin(), body.end(), ')')) break;
                }
                --end;
                continue;
            }
            break;
        }

        if (end == i + prefix_len) {
            i = end;
            continue;
        }

        Hyperlink link;
        link.start_index = static_cast<int64_t>(i);
        link.length = static_cast<int32_t>(end - i);
        link.display_text.assign(text.data() + i, end - i);
        link.url = needs_scheme ? "http://" + link.display_text : link.display_text;
        result.hyperlinks.push_back(std::move(link));

        i = end;
    }

    return result;
}

std::string UrlPatternExtractor::embed(std::string_view content, const std::vector<Hyperlink>&) const {
    return std::string(content);
}

// ---------------------------------------------------------------------------
// CompositeExtractor
// ---------------------------------------------------------------------------

Extraction CompositeExtractor::extract(std::string_view text) const {
    Extraction result = trailer_.extract(text);
    Extraction found = pattern_.extract(result.clean_text);

    for (auto& link : found.hyperlinks) {
        bool overlaps = std::any_of(result.hyperlinks.begin(), result.hyperlinks.end(),
                                    [&link](const Hyperlink& h) {
                                        return link.start_index < h.end_index() &&
                                               h.start_index < link.end_index();
                                    });
        if (!overlaps) {
            result.hyperlinks.push_back(std::move(link));
        }
    }

    std::stable_sort(result.hyperlinks.begin(), result.hyperlinks.end(),
                     [](const Hyperlink& a, const Hyperlink& b) {
                         return a.start_index < b.start_index;
                     });
    return result;
}

std::string CompositeExtractor::embed(std::string_view content, const std::vector<Hyperlink>& links) const {
    return trailer_.embed(content, links);
}

} // namespace textvault
