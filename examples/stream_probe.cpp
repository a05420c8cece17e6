/**
 * @file stream_probe.cpp
 * @brief Peek into a forward-only input through a buffered_stream
 *
 * Reads a file (or standard input when the path is "-") in small chunks,
 * as if it were arriving over the network, dumps a window of bytes at a
 * requested offset and reports how much had to be pulled to get there.
 */

#include <rstream/buffered_stream.hh>
#include <rstream/stream_options.hh>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cout << "Usage: " << argv[0] << " <file|-> <offset> [length]\n";
        std::cout << "\n";
        std::cout << "Dumps length bytes (default 16) at offset, pulling the input lazily.\n";
        return 1;
    }

    std::ifstream file;
    std::istream* input = &std::cin;
    if (std::string(argv[1]) != "-") {
        file.open(argv[1], std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
            return 1;
        }
        input = &file;
    }

    try {
        std::int64_t offset = std::stoll(argv[2]);
        std::size_t length = argc == 4 ? static_cast<std::size_t>(std::stoul(argv[3])) : 16;

        rstream::stream_options opts;
        opts.on_event = [](std::uint64_t at, std::string_view category, std::string_view message) {
            std::cerr << "[" << category << " @" << at << "] " << message << "\n";
        };

        rstream::buffered_stream stream(rstream::chunk_source::from_stream(*input, 256), opts);

        // Negative offsets count from the end, which forces a full read
        if (offset < 0) {
            stream.seek(offset, rstream::buffered_stream::end);
        } else {
            stream.seek(offset);
        }

        std::uint64_t start = stream.tell();
        auto bytes = stream.read_bytes(length);

        std::cout << std::hex << std::setfill('0');
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i % 16 == 0) {
                std::cout << (i ? "\n" : "") << std::setw(8) << (start + i) << ": ";
            }
            std::cout << std::setw(2) << std::to_integer<int>(bytes[i]) << ' ';
        }
        std::cout << std::dec << "\n\n";

        std::cout << "Read " << bytes.size() << " of " << length << " bytes\n";
        std::cout << "Buffered " << stream.buffered_size() << " bytes in "
                  << stream.pull_count() << " pulls"
                  << (stream.exhausted() ? " (input exhausted)" : "") << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
