#include "bench_main.hpp"
#include "membuffer/format/reader.hpp"
#include "membuffer/format/writer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace membuffer;
using namespace membuffer::format;

namespace {

std::vector<byte> build_buffer(const std::string &text, std::int32_t copies) {
    Writer writer;
    for (std::int32_t key = 0; key < copies; ++key) {
        auto ec = writer.add_entry(key, text);
        if (ec) {
            std::cerr << "add_entry failed: " << ec.message() << "\n";
        }
    }
    return writer.finalize();
}

void load_all(const std::vector<byte> &buffer,
              std::int32_t copies,
              std::size_t expected) {
    Reader reader;
    auto ec = Reader::parse(buffer, reader);
    if (ec) {
        std::cerr << "parse failed: " << ec.message() << "\n";
        return;
    }
    for (std::int32_t key = 0; key < copies; ++key) {
        const auto r = reader.load_entry<std::string_view>(key);
        if (!r.ok() || r.value.size() != expected) {
            std::cerr << "load_entry failed for key " << key << "\n";
            return;
        }
        benchmarks::do_not_optimize(r.value);
    }
}

} // namespace

static void bench_reader_payload_1mb() {
    const std::string text(1'000'000, 'a');
    const auto buffer = build_buffer(text, 1);

    BENCH_RUN("Reader: 1MB text field", buffer.size(), 20,
              load_all(buffer, 1, text.size()));
}

static void bench_reader_payload_10mb() {
    const std::string text(10'000'000, 'a');
    const auto buffer = build_buffer(text, 1);

    BENCH_RUN("Reader: 10MB text field", buffer.size(), 10,
              load_all(buffer, 1, text.size()));
}

static void bench_reader_payload_1mb_times_3() {
    const std::string text(1'000'000, 'a');
    const auto buffer = build_buffer(text, 3);

    BENCH_RUN("Reader: 3 x 1MB text fields", buffer.size(), 20,
              load_all(buffer, 3, text.size()));
}

static void bench_reader_unchecked_utf8() {
    // 关闭 UTF-8 校验后，读取耗时与 payload 大小无关。
    const std::string text(10'000'000, 'a');
    const auto buffer = build_buffer(text, 1);
    ReaderOptions options;
    options.validate_utf8 = false;

    BENCH_RUN("Reader: 10MB text field (no utf-8 check)", buffer.size(), 10, {
        Reader reader;
        if (!Reader::parse(buffer, reader, options)) {
            benchmarks::do_not_optimize(reader.load_entry<std::string_view>(0).value);
        }
    });
}

static void bench_json_payload_1mb_times_3() {
    // 对照：同样 3 x 1MB 的内容用 JSON 对象承载，每次完整解析。
    const std::string text(1'000'000, 'a');
    const nlohmann::json doc = {{"one", text}, {"two", text}, {"three", text}};
    const std::string encoded = doc.dump();

    BENCH_RUN("JSON: 3 x 1MB string members", encoded.size(), 20, {
        const auto parsed = nlohmann::json::parse(encoded);
        if (parsed.at("one").get_ref<const std::string &>().size() != text.size()) {
            std::cerr << "json parse mismatch\n";
        }
        benchmarks::do_not_optimize(parsed);
    });
}

static void bench_writer_1mb_times_3() {
    const std::string text(1'000'000, 'a');

    BENCH_RUN("Writer: 3 x 1MB text fields + finalize", 3 * text.size(), 20, {
        const auto buffer = build_buffer(text, 3);
        benchmarks::do_not_optimize(buffer.size());
    });
}

int main() {
    bench_reader_payload_1mb();
    bench_reader_payload_10mb();
    bench_reader_payload_1mb_times_3();
    bench_reader_unchecked_utf8();
    bench_json_payload_1mb_times_3();
    bench_writer_1mb_times_3();

    membuffer::benchmarks::print_results();
    return 0;
}
