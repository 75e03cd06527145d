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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace textvault {

/**
 * A link over a range of text. `start_index` is a byte offset; inside a
 * TextSegment it is file-global.
 */
struct Hyperlink {
    int64_t start_index = 0;
    int32_t length = 0;
    std::string url;
    std::string display_text;

    int64_t end_index() const { return start_index + length; }

    bool contains(int64_t position) const {
        return position >= start_index && position < end_index();
    }

    bool operator==(const Hyperlink& o) const {
        return start_index == o.start_index && length == o.length &&
               url == o.url && display_text == o.display_text;
    }
    bool operator!=(const Hyperlink& o) const { return !(*this == o); }
};

struct Extraction {
    std::string clean_text;
    std::vector<Hyperlink> hyperlinks;
};

/**
 * Pure hyperlink metadata codec. extract() must not modify its input;
 * embed(extract(x).clean_text, extract(x).hyperlinks) reproduces x's links.
 */
class HyperlinkExtractor {
public:
    virtual ~HyperlinkExtractor() = default;

    virtual Extraction extract(std::string_view text) const = 0;

    virtual std::string embed(std::string_view content, const std::vector<Hyperlink>& links) const = 0;

    // Whether links stored in a file trailer should be read back.
    virtual bool reads_trailer() const { return false; }
};

/**
 * Reads and writes the `<!--HYPERLINKS:[...]-->` trailer:
 *
 *   content\n\n<!--HYPERLINKS:[{"start":0,"length":4,"url":"...","text":"..."}]-->
 *
 * Malformed JSON leaves the text untouched with no links.
 */
class MetadataTrailerExtractor : public HyperlinkExtractor {
public:
    static constexpr const char* kStartMarker = "<!--HYPERLINKS:";
    static constexpr const char* kEndMarker = "-->";

    Extraction extract(std::string_view text) const override;
    std::string embed(std::string_view content, const std::vector<Hyperlink>& links) const override;
    bool reads_trailer() const override { return true; }

    // Content with any trailer (and the whitespace before it) removed.
    static std::string remove_metadata(std::string_view content);

    static std::string to_json(const std::vector<Hyperlink>& links);
    static bool from_json(std::string_view json, std::vector<Hyperlink>* out);
};

/**
 * Finds bare http://, https:// and www. URLs. The text is returned
 * unchanged; embed() is the identity.
 */
class UrlPatternExtractor : public HyperlinkExtractor {
public:
    Extraction extract(std::string_view text) const override;
    std::string embed(std::string_view content, const std::vector<Hyperlink>& links) const override;
};

/**
 * Trailer metadata first, then URL patterns over the cleaned text. Pattern
 * matches overlapping a trailer link are dropped.
 */
class CompositeExtractor : public HyperlinkExtractor {
public:
    Extraction extract(std::string_view text) const override;
    std::string embed(std::string_view content, const std::vector<Hyperlink>& links) const override;
    bool reads_trailer() const override { return true; }

private:
    MetadataTrailerExtractor trailer_;
    UrlPatternExtractor pattern_;
};

} // namespace textvault
