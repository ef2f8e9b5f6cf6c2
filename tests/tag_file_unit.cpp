// In-memory coverage of TagFile: lookup, edit/add/remove, render, size and write_to.
#include <cstdint>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "id3forge.hpp"
#include "logging.hpp"
#include "tag_file.hpp"
#include "test_utils.hpp"

namespace {

using namespace id3forge;
using test_utils::as_string;
using test_utils::tag_bytes;
using test_utils::text_frame;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[tag_file_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

TagStatus open_bytes(TagFile &tag, const std::vector<uint8_t> &bytes) {
    return tag.open(std::make_unique<std::istringstream>(as_string(bytes)));
}

std::string written(TagFile &tag, TagStatus &status) {
    std::ostringstream out;
    status = tag.write_to(out);
    return out.str();
}

const std::vector<uint8_t> kAudio = {0xFF, 0xFB, 0x90, 0x44, 0x00, 0x11, 0x22, 0x33};

bool test_render_and_lookup() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagFile tag(log);
    auto status = open_bytes(tag, tag_bytes({text_frame("TXXX", "a"), text_frame("TIT2", "b"),
                                             text_frame("TXXX", "c")},
                                            kAudio));
    bool ok = check(status.ok, "tag opens");
    ok &= check(tag.frames().size() == 3, "three frames");
    ok &= check(tag.render(false, false) == "TXXX a\nTIT2 b\nTXXX c", "render order");

    FrameLookup second = tag.lookup("TXXX", 1);
    ok &= check(second.found && second.position == 2, "second TXXX is at position 2");
    ok &= check(tag.frames()[second.position].data == "c", "second TXXX data");

    FrameLookup third = tag.lookup("TXXX", 2);
    ok &= check(!third.found && third.match_count == 2, "no third TXXX, two seen");

    FrameLookup missing = tag.lookup("COMM", 0);
    ok &= check(!missing.found && missing.match_count == 0, "no COMM at all");
    return ok;
}

bool test_edit_add_remove() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagFile tag(log);
    auto status = open_bytes(tag, tag_bytes({text_frame("TIT2", "Hello"),
                                             text_frame("TXXX", "one"),
                                             text_frame("TXXX", "two")},
                                            kAudio));
    bool ok = check(status.ok, "tag opens");

    FrameLookup edited = tag.edit("TIT2", 0, "World");
    ok &= check(edited.found, "edit finds TIT2");
    ok &= check(tag.render(false, false).find("TIT2 World") == 0, "edited text rendered");
    ok &= check(tag.frames()[0].size == 5, "edited size follows the payload");

    FrameLookup absent = tag.remove("COMM", 0);
    ok &= check(!absent.found && absent.match_count == 0, "remove of absent id fails");
    ok &= check(tag.frames().size() == 3, "failed remove leaves frames alone");

    FrameLookup removed = tag.remove("TXXX", 0);
    ok &= check(removed.found && tag.frames().size() == 2, "remove first TXXX");
    FrameLookup renumbered = tag.lookup("TXXX", 0);
    ok &= check(renumbered.found && tag.frames()[renumbered.position].data == "two",
                "remaining TXXX becomes the first");

    FrameLookup too_far = tag.edit("TXXX", 1, "x");
    ok &= check(!too_far.found && too_far.match_count == 1, "edit past the last match fails");

    ok &= check(tag.add("TPE1", "Artist").ok, "add accepts a valid id");
    ok &= check(tag.frames().back().id == "TPE1" && tag.frames().back().data == "Artist",
                "add appends");
    ok &= check(tag.render(false, false) == "TIT2 World\nTXXX two\nTPE1 Artist", "final render");
    return ok;
}

bool test_add_rejects_bad_ids() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Error, sink);
    TagFile tag(log);
    bool ok = check(open_bytes(tag, tag_bytes({text_frame("TIT2", "Hi")}, kAudio)).ok,
                    "tag opens");

    const TagStatus short_id = tag.add("A", "x");
    ok &= check(!short_id.ok && short_id.error == TagError::BadFrameId, "short id rejected");
    const TagStatus long_id = tag.add("TPE12", "x");
    ok &= check(!long_id.ok && long_id.error == TagError::BadFrameId, "long id rejected");
    const TagStatus lower_id = tag.add("tpe1", "x");
    ok &= check(!lower_id.ok && lower_id.error == TagError::BadFrameId, "lowercase id rejected");
    ok &= check(tag.frames().size() == 1, "rejected frames are not added");

    ok &= check(tag.add("TPE1", "y").ok, "valid id accepted after a rejection");
    TagStatus status;
    const std::string out = written(tag, status);
    ok &= check(status.ok, "tag writes");

    TagFile reread(log);
    ok &= check(reread.open(std::make_unique<std::istringstream>(out)).ok, "output re-parses");
    ok &= check(reread.frames().size() == 2, "every written frame reads back");
    ok &= check(reread.render(false, false) == "TIT2 Hi\nTPE1 y", "frames after the add survive");
    return ok;
}

bool test_render_flags() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagFile tag(log);
    auto status = open_bytes(
        tag, tag_bytes({test_utils::frame_bytes("TIT2", test_utils::bytes_of("x"), true, 0x20, 0),
                        text_frame("TPE1", "y")},
                       kAudio));
    bool ok = check(status.ok, "tag opens");
    ok &= check(tag.render(true, false) == "TIT2 r..... x\nTPE1 ...... y", "compact flags");
    ok &= check(tag.render(true, true) == "TIT2 (read-only) x\nTPE1 y", "human flags");
    ok &= check(tag.render(false, true) == "TIT2 x\nTPE1 y", "flags hidden");
    return ok;
}

bool test_empty_tag() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagFile tag(log);
    auto status = open_bytes(tag, tag_bytes({}, kAudio));
    bool ok = check(status.ok, "empty tag opens");
    ok &= check(tag.frames().empty(), "no frames");
    ok &= check(tag.render(false, false) == std::string(kNoFramesLine), "placeholder line");
    ok &= check(tag.compute_tag_size() == 0, "empty tag size");

    TagStatus write_status;
    const std::string out = written(tag, write_status);
    ok &= check(write_status.ok && out == as_string(tag_bytes({}, kAudio)), "empty tag writes");
    return ok;
}

bool test_roundtrip_identity() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);

    const std::vector<uint8_t> v4 = tag_bytes(
        {text_frame("TIT2", "Title"),
         test_utils::frame_bytes("TPE1", {0xFF, 0xFE, 'A', 0x00, 'B', 0x00, 0x00, 0x00}),
         test_utils::frame_bytes("PRIV", {'o', 'w', 'n', 0x00, 0x01}, true, 0x60, 0x00)},
        kAudio);
    TagFile tag(log);
    bool ok = check(open_bytes(tag, v4).ok, "v4 tag opens");
    ok &= check(tag.compute_tag_size() == v4.size() - kTagHeaderSize - kAudio.size(),
                "computed size matches the header");
    TagStatus status;
    ok &= check(as_string(v4) == written(tag, status) && status.ok, "v4 round trip is identical");

    const std::vector<uint8_t> v3 = tag_bytes(
        {text_frame("TIT2", std::string(200, 't'), false), text_frame("TALB", "Album", false)},
        kAudio, 3);
    TagFile tag3(log);
    ok &= check(open_bytes(tag3, v3).ok, "v3 tag opens");
    ok &= check(tag3.frame_size_convention() == FrameSizeConvention::BigEndian,
                "v3 uses big-endian frame sizes");
    ok &= check(tag3.frames().size() == 2 && tag3.frames()[0].size == 200, "v3 sizes decoded");
    ok &= check(as_string(v3) == written(tag3, status) && status.ok, "v3 round trip is identical");

    const std::vector<uint8_t> ext = {0x00, 0x00, 0x00, 0x02, 0xAA, 0xBB};
    const std::vector<uint8_t> with_ext =
        tag_bytes({text_frame("TIT2", "x")}, kAudio, 4, 0, 0x40, ext);
    TagFile tag_ext(log);
    ok &= check(open_bytes(tag_ext, with_ext).ok, "extended header tag opens");
    ok &= check(tag_ext.compute_tag_size() == ext.size() + kFrameHeaderSize + 1,
                "extended header counted in the size");
    ok &= check(as_string(with_ext) == written(tag_ext, status) && status.ok,
                "extended header round trip is identical");
    return ok;
}

bool test_modified_write() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagFile tag(log);
    bool ok = check(open_bytes(tag, tag_bytes({text_frame("TIT2", "Hello")}, kAudio)).ok,
                    "tag opens");
    tag.edit("TIT2", 0, "Caf\xC3\xA9 \xE6\x97\xA5");
    ok &= check(tag.add("TPE1", "Artist").ok, "add TPE1");

    TagStatus status;
    const std::string out = written(tag, status);
    ok &= check(status.ok, "modified tag writes");
    ok &= check(out.size() >= kAudio.size() &&
                    out.compare(out.size() - kAudio.size(), kAudio.size(), as_string(kAudio)) == 0,
                "audio follows the tag unchanged");

    TagFile reread(log);
    ok &= check(reread.open(std::make_unique<std::istringstream>(out)).ok, "output re-parses");
    ok &= check(reread.header().size == tag.compute_tag_size(), "header size updated");
    ok &= check(reread.render(false, false) == "TIT2 Caf\xC3\xA9 \xE6\x97\xA5\nTPE1 Artist",
                "edited and added frames read back");
    ok &= check(reread.frames()[0].encoding == TextEncoding::Utf16BigEndian,
                "non-Latin-1 text written as UTF-16BE");
    ok &= check(reread.frames()[1].encoding == TextEncoding::Latin1,
                "Latin-1 text written as Latin-1");
    return ok;
}

bool test_utf16_policy() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagOptions options;
    options.text_policy = TextWritePolicy::Utf16;
    TagFile tag(log, options);
    bool ok = check(open_bytes(tag, tag_bytes({text_frame("TIT2", "Hello"),
                                               text_frame("TPE1", "Caf\xE9")},
                                              kAudio))
                        .ok,
                    "tag opens");

    TagStatus status;
    const std::string out = written(tag, status);
    ok &= check(status.ok, "UTF-16 tag writes");

    TagFile reread(log);
    ok &= check(reread.open(std::make_unique<std::istringstream>(out)).ok, "output re-parses");
    ok &= check(reread.render(false, false) == "TIT2 Hello\nTPE1 Caf\xC3\xA9", "text survives");
    bool all_utf16 = reread.frames().size() == 2;
    for (const auto &f : reread.frames()) {
        all_utf16 = all_utf16 && f.encoding == TextEncoding::Utf16BigEndian &&
                    f.payload.size() >= 4 && f.payload[f.payload.size() - 1] == 0x00 &&
                    f.payload[f.payload.size() - 2] == 0x00;
    }
    ok &= check(all_utf16, "every frame is BOM-marked UTF-16BE with a terminator");
    ok &= check(log.warning_count() == 0, "no warnings reading UTF-16 output");
    return ok;
}

bool test_padding_ends_frames() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    std::vector<uint8_t> padded = text_frame("TIT2", "x");
    padded.resize(padded.size() + 32, 0x00);
    TagFile tag(log);
    bool ok = check(open_bytes(tag, tag_bytes({padded}, kAudio)).ok, "padded tag opens");
    ok &= check(tag.frames().size() == 1 && tag.frames()[0].data == "x", "padding is not a frame");
    return ok;
}

bool test_open_failures() {
    std::ostringstream sink;
    Logger log(LogVerbosity::Error, sink);
    TagFile tag(log);
    auto bad = open_bytes(tag, {'R', 'I', 'F', 'F', 0, 0, 0, 0, 0, 0});
    bool ok = check(!bad.ok && bad.error == TagError::BadMagic, "non-ID3 input rejected");

    std::vector<uint8_t> cut = tag_bytes({text_frame("TIT2", "Hello")}, {});
    cut.resize(cut.size() - 3);
    auto truncated = open_bytes(tag, cut);
    ok &= check(!truncated.ok && truncated.error == TagError::ShortRead, "truncated frame");
    ok &= check(tag.frames().empty(), "no partial frame list after failure");

    auto missing = tag.open(std::string("/nonexistent/dir/none.mp3"));
    ok &= check(!missing.ok && missing.error == TagError::OpenFailed, "missing file");

    TagFile unsaved(log);
    ok &= check(open_bytes(unsaved, tag_bytes({}, kAudio)).ok, "stream tag opens");
    auto no_path = unsaved.save();
    ok &= check(!no_path.ok && no_path.error == TagError::NoSourcePath, "save needs a path");

    TagFile never_opened(log);
    std::ostringstream out;
    ok &= check(!never_opened.write_to(out).ok, "write_to needs an opened tag");
    return ok;
}

bool test_messages_and_json() {
    bool ok = check(lookup_failure_message("COMM", 1, 0, "remove") ==
                        "No frame found with id \"COMM\"",
                    "no-match message");
    ok &= check(lookup_failure_message("TXXX", 3, 1, "edit") ==
                    "There is only 1 frame with id \"TXXX\". You tried to edit the 3rd",
                "single-match message");
    ok &= check(lookup_failure_message("TXXX", 4, 2, "remove") ==
                    "There are only 2 frames with id \"TXXX\". You tried to remove the 4th",
                "multi-match message");
    ok &= check(ordinal_suffix(1) == "st" && ordinal_suffix(2) == "nd" &&
                    ordinal_suffix(11) == "th",
                "ordinal suffixes");
    ok &= check(!version_string().empty() && version_string()[0] == 'v', "version string");

    std::ostringstream sink;
    Logger log(LogVerbosity::Warn, sink);
    TagFile tag(log);
    ok &= check(open_bytes(tag, tag_bytes({text_frame("TIT2", "Song"), text_frame("ZZZZ", "?")},
                                          kAudio))
                    .ok,
                "tag opens");
    const auto j = nlohmann::json::parse(tag_to_json(tag));
    ok &= check(j["version"][0] == 4 && j["version"][1] == 0, "json version");
    ok &= check(j["frames"].size() == 2, "json frame count");
    ok &= check(j["frames"][0]["id"] == "TIT2" && j["frames"][0]["data"] == "Song",
                "json frame fields");
    ok &= check(j["frames"][0]["encoding"] == "latin1", "json encoding");
    ok &= check(j["frames"][0].contains("description"), "known id has a description");
    ok &= check(!j["frames"][1].contains("description"), "unknown id has none");
    ok &= check(j["frames"][0]["flags"]["read_only"] == false, "json flags");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_render_and_lookup();
    ok &= test_edit_add_remove();
    ok &= test_add_rejects_bad_ids();
    ok &= test_render_flags();
    ok &= test_empty_tag();
    ok &= test_roundtrip_identity();
    ok &= test_modified_write();
    ok &= test_utf16_policy();
    ok &= test_padding_ends_frames();
    ok &= test_open_failures();
    ok &= test_messages_and_json();
    return ok ? 0 : 1;
}
