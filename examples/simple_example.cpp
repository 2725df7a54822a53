/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic libpngme usage
 *
 * Builds a chunk carrying a message, prints its serialized frame as hex,
 * then parses the frame back and prints the recovered chunk.
 */

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <iomanip>

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cout << "Usage: " << argv[0] << " <chunk-type> <message>\n";
        std::cout << "\n";
        std::cout << "Example: " << argv[0] << " ruSt \"hidden text\"\n";
        return 1;
    }

    try {
        pngme::chunk_type type(argv[1]);
        if (!type.is_valid()) {
            std::cerr << "Warning: chunk type '" << type << "' has the reserved bit set\n";
        }

        pngme::chunk original(type, std::string_view(argv[2]));
        auto frame = original.serialize();

        std::cout << "Frame (" << frame.size() << " bytes):\n";
        for (std::size_t i = 0; i < frame.size(); i++) {
            std::cout << std::hex << std::setw(2) << std::setfill('0')
                      << static_cast<unsigned>(frame[i]) << ((i % 16 == 15) ? '\n' : ' ');
        }
        std::cout << std::dec << "\n";

        auto parsed = pngme::chunk::parse(frame);
        std::cout << parsed << "\n";

    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error (" << pngme::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
