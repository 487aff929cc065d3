#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "chunkwire/sink.hpp"
#include "chunkwire/source.hpp"
#include "test_support.hpp"

using namespace chunkwire;
using testsupport::pattern;
namespace fs = std::filesystem;

// Scratch directory removed when the test ends.
struct TempDir {
    fs::path path;
    explicit TempDir(const char* tag) {
        path = fs::temp_directory_path() / (std::string("chunkwire-") + tag + "-" +
                                            std::to_string(reinterpret_cast<uintptr_t>(this)));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

static std::vector<uint8_t> read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> drain(ISource& src) {
    std::vector<uint8_t> all, block;
    std::string err;
    for (;;) {
        const ReadStatus st = src.next(block, err);
        if (st != ReadStatus::Chunk) {
            REQUIRE(st == ReadStatus::End);
            break;
        }
        all.insert(all.end(), block.begin(), block.end());
    }
    return all;
}

// ---------- sources ----------

TEST_CASE("SliceSource reads chunk-sized slices then End") {
    const auto data = pattern(10);
    SliceSource src(std::make_unique<MemoryRangeReader>(data), 4);
    CHECK(src.total_size() == 10);
    CHECK(std::string(src.kind()) == "slice");

    std::vector<uint8_t> b;
    std::string err;
    REQUIRE(src.next(b, err) == ReadStatus::Chunk);
    CHECK(b.size() == 4);
    REQUIRE(src.next(b, err) == ReadStatus::Chunk);
    CHECK(b.size() == 4);
    REQUIRE(src.next(b, err) == ReadStatus::Chunk);
    CHECK(b.size() == 2);
    CHECK(src.next(b, err) == ReadStatus::End);
}

// Reader that claims more bytes than it can produce.
class ShrunkReader : public IRangeReader {
public:
    bool read(uint64_t offset, size_t len, std::vector<uint8_t>& out, std::string&) override {
        out.clear();
        if (offset < 3) out.assign(len < 3 ? len : 3, 0x11);
        return true;
    }
    uint64_t size() const override { return 8; }
};

TEST_CASE("SliceSource reports a reader that runs dry early") {
    SliceSource src(std::make_unique<ShrunkReader>(), 3);
    std::vector<uint8_t> b;
    std::string err;
    REQUIRE(src.next(b, err) == ReadStatus::Chunk);
    CHECK(src.next(b, err) == ReadStatus::Error);
    CHECK_FALSE(err.empty());
}

TEST_CASE("StreamSource delivers the stream in blocks") {
    const auto data = pattern(1000);
    auto in = std::make_unique<std::istringstream>(std::string(data.begin(), data.end()));
    StreamSource src(std::move(in), data.size(), 256);
    CHECK(std::string(src.kind()) == "stream");
    CHECK(drain(src) == data);
}

TEST_CASE("File sources: stream and slice modes agree with the file") {
    TempDir dir("src");
    const fs::path file = dir.path / "input.bin";
    const auto data = pattern(5000, 3);
    {
        std::ofstream out(file, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    for (SourceMode mode : { SourceMode::Stream, SourceMode::Slice }) {
        std::unique_ptr<ISource> src;
        std::string err;
        REQUIRE(open_file_source(file.string(), mode, 1024, src, err));
        CHECK(src->total_size() == 5000);
        CHECK(drain(*src) == data);
    }

    std::unique_ptr<ISource> src;
    std::string err;
    CHECK_FALSE(open_file_source((dir.path / "missing").string(), SourceMode::Slice, 1024, src, err));
    CHECK_FALSE(open_file_source(dir.path.string(), SourceMode::Stream, 1024, src, err));
    CHECK_FALSE(err.empty());
}

// ---------- sinks ----------

TEST_CASE("sanitize_file_name keeps one safe component") {
    CHECK(sanitize_file_name("photo.jpg") == "photo.jpg");
    CHECK(sanitize_file_name("../../etc/passwd") == "passwd");
    CHECK(sanitize_file_name("C:\\Users\\x\\doc.txt") == "doc.txt");
    CHECK(sanitize_file_name("a\nb") == "a_b");
    CHECK(sanitize_file_name("") == "download.bin");
    CHECK(sanitize_file_name("..") == "download.bin");
    CHECK(sanitize_file_name("dir/") == "download.bin");
}

TEST_CASE("FileSinkProvider writes into the directory and closes") {
    TempDir dir("sink");
    FileSinkProvider p(dir.path.string());
    std::unique_ptr<IWriter> w;
    std::string err;
    REQUIRE(p.open("../escape.bin", 6, w, err) == OpenStatus::Ready);
    CHECK(std::string(w->kind()) == "file");

    const std::vector<uint8_t> bytes{ 1, 2, 3, 4, 5, 6 };
    REQUIRE(w->write(bytes.data(), 3, err));
    REQUIRE(w->write(bytes.data() + 3, 3, err));
    REQUIRE(w->close(err));
    CHECK(read_all(dir.path / "escape.bin") == bytes);
}

TEST_CASE("FileSinkProvider abort removes the partial file") {
    TempDir dir("abort");
    FileSinkProvider p(dir.path.string(), (dir.path / "exact.out").string());
    std::unique_ptr<IWriter> w;
    std::string err;
    REQUIRE(p.open("ignored-name", 3, w, err) == OpenStatus::Ready);
    const uint8_t b[3] = { 9, 9, 9 };
    REQUIRE(w->write(b, 3, err));
    CHECK(fs::exists(dir.path / "exact.out"));
    CHECK(w->abort(err));
    CHECK_FALSE(fs::exists(dir.path / "exact.out"));
}

TEST_CASE("FileSinkProvider is unavailable without a directory") {
    FileSinkProvider p("/definitely/not/a/dir");
    std::unique_ptr<IWriter> w;
    std::string err;
    CHECK(p.open("x", 1, w, err) == OpenStatus::Unavailable);
    CHECK_FALSE(w);
}

TEST_CASE("StreamSinkProvider writes to the ostream") {
    std::ostringstream os;
    StreamSinkProvider p(&os);
    std::unique_ptr<IWriter> w;
    std::string err;
    REQUIRE(p.open("x", 3, w, err) == OpenStatus::Ready);
    REQUIRE(w->write(reinterpret_cast<const uint8_t*>("abc"), 3, err));
    REQUIRE(w->close(err));
    CHECK(os.str() == "abc");

    StreamSinkProvider none(nullptr);
    CHECK(none.open("x", 3, w, err) == OpenStatus::Unavailable);
}

TEST_CASE("MemoryWriter concatenates parts and saves once") {
    std::string saved_name;
    std::vector<uint8_t> saved;
    int saves = 0;
    MemoryWriter w("report.pdf", [&](const std::string& n, const std::vector<uint8_t>& blob, std::string&) {
        saved_name = n;
        saved = blob;
        ++saves;
        return true;
    });

    std::string err;
    const auto a = pattern(10, 1);
    const auto b = pattern(7, 2);
    w.accumulate(a.data(), a.size());
    REQUIRE(w.write(b.data(), b.size(), err));
    CHECK(w.size() == 17);
    REQUIRE(w.finalize(err));

    std::vector<uint8_t> expect = a;
    expect.insert(expect.end(), b.begin(), b.end());
    CHECK(saved == expect);
    CHECK(saved_name == "report.pdf");
    CHECK(saves == 1);

    CHECK_FALSE(w.finalize(err));             // second close is an error
    CHECK_FALSE(w.write(a.data(), 1, err));
    CHECK(saves == 1);
}

TEST_CASE("MemoryWriter abort discards and never saves") {
    int saves = 0;
    MemoryWriter w("x", [&](const std::string&, const std::vector<uint8_t>&, std::string&) { ++saves; return true; });
    std::string err;
    const uint8_t b[2] = { 1, 2 };
    REQUIRE(w.write(b, 2, err));
    CHECK(w.abort(err));
    CHECK(w.size() == 0);
    CHECK_FALSE(w.close(err));
    CHECK(saves == 0);
}

TEST_CASE("MemorySinkProvider limits") {
    SaveFn save = [](const std::string&, const std::vector<uint8_t>&, std::string&) { return true; };
    std::unique_ptr<IWriter> w;
    std::string err;

    MemorySinkProvider small(save, 100);
    CHECK(small.open("x", 101, w, err) == OpenStatus::Unavailable);
    CHECK(small.open("x", 100, w, err) == OpenStatus::Ready);

    MemorySinkProvider unsaved(SaveFn{});
    CHECK(unsaved.open("x", 1, w, err) == OpenStatus::Unavailable);
}

// ---------- chain ----------

TEST_CASE("SinkChain falls back past unavailable providers in order") {
    std::vector<uint8_t> got;
    auto first = std::make_unique<testsupport::VectorSinkProvider>(&got);
    first->unavailable = true;
    auto* first_raw = first.get();

    SinkChain chain;
    chain.add(std::move(first))
         .add(std::make_unique<StreamSinkProvider>(nullptr))
         .add(std::make_unique<testsupport::VectorSinkProvider>(&got));
    CHECK(chain.size() == 3);

    std::unique_ptr<IWriter> w;
    std::string err;
    REQUIRE(chain.poll("f", 1, w, err) == OpenStatus::Ready);
    CHECK(std::string(chain.selected()) == "vector");
    CHECK(first_raw->open_calls == 1);
}

TEST_CASE("SinkChain stays on a pending provider") {
    std::vector<uint8_t> got;
    bool gate = false;
    auto p = std::make_unique<testsupport::VectorSinkProvider>(&got);
    p->gate = &gate;
    auto* raw = p.get();

    SinkChain chain;
    chain.add(std::move(p)).add(std::make_unique<StreamSinkProvider>(nullptr));

    std::unique_ptr<IWriter> w;
    std::string err;
    CHECK(chain.poll("f", 1, w, err) == OpenStatus::Pending);
    CHECK(chain.poll("f", 1, w, err) == OpenStatus::Pending);
    CHECK(raw->open_calls == 2);
    CHECK(chain.selected() == nullptr);

    gate = true;
    CHECK(chain.poll("f", 1, w, err) == OpenStatus::Ready);
    CHECK(std::string(chain.selected()) == "vector");
}

TEST_CASE("SinkChain exhausted lists every reason") {
    SinkChain chain;
    chain.add(std::make_unique<FileSinkProvider>("/definitely/not/a/dir"))
         .add(std::make_unique<StreamSinkProvider>(nullptr));

    std::unique_ptr<IWriter> w;
    std::string err;
    CHECK(chain.poll("f", 1, w, err) == OpenStatus::Failed);
    CHECK(err.find("file: ") != std::string::npos);
    CHECK(err.find("stream: no output stream") != std::string::npos);

    SinkChain empty;
    CHECK(empty.poll("f", 1, w, err) == OpenStatus::Failed);
    CHECK(err == "no sink providers");
}
