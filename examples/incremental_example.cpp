#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <cstdint>
#include <unspool.hpp>

using namespace unspool;

// A sensor reading as it appears on the wire:
//   word8     sensor id
//   word32be  timestamp (seconds)
//   word16le  payload length
//   payload   isolated to exactly `length` bytes: a list of word16be samples
struct Reading {
    uint8_t sensor;
    uint32_t timestamp;
    std::vector<uint16_t> samples;
};

Decoder<Reading> reading_decoder() {
    return label("reading", get_word8().and_then([](uint8_t sensor) {
        return get_word32be().and_then([sensor](uint32_t timestamp) {
            return get_word16le().and_then([sensor, timestamp](uint16_t length) {
                return label("payload", isolate(length, get_list_of(get_word16be())))
                    .map([sensor, timestamp](std::vector<uint16_t> samples) {
                        return Reading{sensor, timestamp, std::move(samples)};
                    });
            });
        });
    }));
}

// Helper function to print a decoded reading
void printReading(const Reading& r) {
    std::cout << "  Sensor: " << static_cast<int>(r.sensor) << "\n";
    std::cout << "  Timestamp: " << r.timestamp << "\n";
    std::cout << "  Samples:";
    for (auto s : r.samples) {
        std::cout << " " << s;
    }
    std::cout << "\n" << std::endl;
}

void printBytes(const ByteString& bytes) {
    std::cout << std::hex << std::setfill('0');
    for (auto b : bytes) {
        std::cout << " " << std::setw(2) << static_cast<int>(b);
    }
    std::cout << std::dec << "\n";
}

int main() {
    std::cout << "UNSPOOL Incremental Decoding Examples\n";
    std::cout << "=====================================\n\n";

    // sensor 7, timestamp 1699000000, 12 byte payload: count 2, samples 100 and 200
    const ByteString wire{0x07, 0x65, 0x44, 0xAE, 0xC0, 0x0C, 0x00, 0x00, 0x00, 0x00, 0x00,
                          0x00, 0x00, 0x00, 0x02, 0x00, 0x64, 0x00, 0xC8, 0xEE};

    // Example 1: Decoding a complete buffer
    std::cout << "1. Decoding a Complete Buffer\n";
    std::cout << "-----------------------------\n";

    auto decoded = run_with_remainder(reading_decoder(), wire, 0);
    if (decoded) {
        printReading(decoded->first);
        std::cout << "  Unconsumed:";
        printBytes(decoded->second);
        std::cout << std::endl;
    }

    // Example 2: Feeding the same bytes three at a time
    std::cout << "2. Feeding Chunks\n";
    std::cout << "-----------------\n";

    auto result = run_partial(reading_decoder(), wire.take(3));
    std::size_t fed = 3;
    while (result.is_partial()) {
        std::cout << "  Partial after " << fed << " bytes\n";
        ByteString chunk = wire.drop(fed).take(3);
        fed += chunk.size();
        result = std::move(result).feed(std::move(chunk));
    }
    if (result.is_done()) {
        std::cout << "  Done after " << fed << " bytes\n";
        printReading(result.value());
    }

    // Example 3: A stream that ends early
    std::cout << "3. Truncated Stream\n";
    std::cout << "-------------------\n";

    auto truncated = run_partial(reading_decoder(), wire.take(12));
    truncated = std::move(truncated).feed(ByteString{}); // End of input
    if (truncated.is_fail()) {
        std::cout << truncated.error().message() << std::endl;
    }

    // Example 4: Falling back to an alternative layout
    std::cout << "4. Alternatives and Look-Ahead\n";
    std::cout << "------------------------------\n";

    // Version byte 2 selects the reading layout; anything else is a bare sensor id
    auto versioned = get_word8()
                         .and_then([](uint8_t version) {
                             return version == 2 ? reading_decoder()
                                                 : fail<Reading>("unknown version");
                         })
                         .or_else(get_word8().map([](uint8_t sensor) {
                             return Reading{sensor, 0, {}};
                         }));

    auto peeked = run(look_ahead(get_word8()), wire);
    if (peeked) {
        std::cout << "  First byte: " << static_cast<int>(*peeked) << " (not consumed)\n";
    }
    auto fallback = run(versioned, wire);
    if (fallback) {
        printReading(*fallback);
    }

    return 0;
}
