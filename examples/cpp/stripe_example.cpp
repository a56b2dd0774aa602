/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "stripe.h"
#include "loopback/loopback_transport.h"
#include "common/md5.h"

#define DEFAULT_CONNECTIONS 20
#define DEFAULT_DC 1
#define HOME_DC 1

// Progress bar configuration
#define PROGRESS_WIDTH 50

/**
 * @brief Print program usage information
 * @param program_name The name of the program executable
 */
void
print_usage(const char *program_name) {
    std::cerr << "Usage: " << program_name << " [options] FILE\n"
              << "Options:\n"
              << "  -c, --connections N     Maximum parallel connections, 1..20 (default: "
              << DEFAULT_CONNECTIONS << ")\n"
              << "  -d, --dc ID             Data-center to place the object on, 1..3 (default: "
              << DEFAULT_DC << ")\n"
              << "  -l, --latency US        Maximum simulated latency per request in microseconds\n"
              << "  -i, --interval MS       Minimum interval between progress updates\n"
              << "  -o, --output PATH       Where to write the downloaded copy (default: FILE.out)\n"
              << "  -h, --help              Show this help message\n"
              << "\nExamples:\n"
              << "  " << program_name << " -c 8 big.iso\n"
              << "  " << program_name << " -c 20 -d 2 -l 500 -o copy.bin big.iso\n";
}

/**
 * @brief Print a progress bar to the console
 * @param progress Progress value between 0.0 and 1.0
 */
void
printProgress(float progress) {
    int barWidth = PROGRESS_WIDTH;

    std::cout << "[";
    int pos = barWidth * progress;
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos)
            std::cout << "=";
        else if (i == pos)
            std::cout << ">";
        else
            std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << (progress * 100.0) << "% ";

    if (progress >= 1.0) {
        std::cout << "DONE!" << std::endl;
    } else {
        std::cout << "\r";
        std::cout.flush();
    }
}

std::string
format_rate(uint64_t bytes, std::chrono::steady_clock::duration elapsed) {
    const double seconds = std::chrono::duration<double>(elapsed).count();
    std::stringstream ss;
    ss << std::fixed << std::setprecision(3) << seconds << " sec";
    if (seconds > 0)
        ss << ", " << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) / seconds << " MiB/s";
    return ss.str();
}

std::string
file_md5(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> buf(1 << 20);
    stripeMd5 md5;
    while (in) {
        in.read(buf.data(), buf.size());
        md5.update(reinterpret_cast<const uint8_t *>(buf.data()), in.gcount());
    }
    return md5.hexDigest();
}

int
main(int argc, char *argv[]) {
    int opt;
    int connections = DEFAULT_CONNECTIONS;
    int dc_id = DEFAULT_DC;
    long latency_us = 0;
    long interval_ms = 0;
    std::string output;

    static struct option long_options[] = {{"connections", required_argument, 0, 'c'},
                                           {"dc", required_argument, 0, 'd'},
                                           {"latency", required_argument, 0, 'l'},
                                           {"interval", required_argument, 0, 'i'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    while ((opt = getopt_long(argc, argv, "c:d:l:i:o:h", long_options, NULL)) != -1) {
        switch (opt) {
        case 'c':
            connections = atoi(optarg);
            if (connections < 1 || connections > 20) {
                std::cerr << "Error: Connections must be within 1..20\n";
                return 1;
            }
            break;
        case 'd':
            dc_id = atoi(optarg);
            if (dc_id < 1 || dc_id > 3) {
                std::cerr << "Error: Data-center must be within 1..3\n";
                return 1;
            }
            break;
        case 'l':
            latency_us = atol(optarg);
            if (latency_us < 0) {
                std::cerr << "Error: Latency must not be negative\n";
                return 1;
            }
            break;
        case 'i':
            interval_ms = atol(optarg);
            if (interval_ms < 0) {
                std::cerr << "Error: Interval must not be negative\n";
                return 1;
            }
            break;
        case 'o':
            output = optarg;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    if (optind != argc - 1) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string input = argv[optind];
    if (output.empty()) output = input + ".out";

    // Loopback service with three data-centers, logged in on the first one
    auto store = std::make_shared<stripeLoopbackStore>();
    store->setLatency(std::chrono::microseconds(latency_us));
    auto transport = std::make_shared<stripeLoopbackTransport>(store);

    stripe_auth_key_t key;
    stripeEndpoint endpoint;
    std::unique_ptr<iStripeConnection> primary;
    if (store->authorize(HOME_DC, key) != STRIPE_SUCCESS ||
        transport->getEndpoint(HOME_DC, endpoint) != STRIPE_SUCCESS ||
        transport->connect(endpoint, key, primary) != STRIPE_SUCCESS) {
        std::cerr << "Error: Failed to log in to the loopback service\n";
        return 1;
    }

    std::shared_ptr<iStripeConnection> primary_conn(std::move(primary));
    int ret_code = 0;
    {
        auto session = std::make_shared<stripeSession>(transport, primary_conn, key);
        const stripeAgent agent(session,
                                stripeAgentConfig(static_cast<uint16_t>(connections),
                                                  0,
                                                  std::chrono::milliseconds(interval_ms)));

        const stripe_progress_cb_t progress = [](uint64_t done, uint64_t total) {
            printProgress(total ? static_cast<float>(done) / total : 1.0f);
        };

        std::cout << "\n============================================================" << std::endl;
        std::cout << "                 STRIPE LOOPBACK TRANSFER                    " << std::endl;
        std::cout << "============================================================" << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "- Source: " << input << std::endl;
        std::cout << "- Destination: " << output << std::endl;
        std::cout << "- Max connections: " << connections << std::endl;
        std::cout << "- Object data-center: " << dc_id << std::endl;
        std::cout << "- Simulated latency: up to " << latency_us << " us" << std::endl;
        std::cout << "============================================================\n" << std::endl;

        std::cout << "=== Upload ===" << std::endl;
        stripeFileReference ref;
        uint64_t size = 0;
        auto start = std::chrono::steady_clock::now();
        stripe_status_t status = agent.uploadObject(input, ref, size, progress);
        if (status != STRIPE_SUCCESS) {
            std::cerr << "Error: Upload failed: " << stripeEnumStrings::statusStr(status) << "\n";
            return 1;
        }
        std::cout << "Uploaded " << size << " bytes in " << ref.partCount << " parts ("
                  << format_rate(size, std::chrono::steady_clock::now() - start) << ")"
                  << std::endl;
        std::cout << "- File id: " << ref.fileId << std::endl;
        std::cout << "- MD5: " << ref.md5Checksum.value_or("(large object)") << std::endl;

        stripeFileLocation location;
        status = store->publish(ref, dc_id, location);
        if (status != STRIPE_SUCCESS) {
            std::cerr << "Error: Publish failed: " << stripeEnumStrings::statusStr(status) << "\n";
            return 1;
        }

        std::cout << "\n=== Download ===" << std::endl;
        start = std::chrono::steady_clock::now();
        status = agent.downloadObject(location, size, output, progress);
        if (status != STRIPE_SUCCESS) {
            std::cerr << "Error: Download failed: " << stripeEnumStrings::statusStr(status)
                      << "\n";
            return 1;
        }
        std::cout << "Downloaded " << size << " bytes ("
                  << format_rate(size, std::chrono::steady_clock::now() - start) << ")"
                  << std::endl;

        std::cout << "\n=== Verification ===" << std::endl;
        const std::string source_md5 = file_md5(input);
        const std::string copy_md5 = file_md5(output);
        std::cout << "- Source MD5: " << source_md5 << std::endl;
        std::cout << "- Copy MD5:   " << copy_md5 << std::endl;
        if (source_md5 != copy_md5) {
            std::cerr << "Error: Copy does not match the source\n";
            ret_code = 1;
        }
        std::cout << "- Connections opened: " << store->getConnectCount() - 1 << std::endl;
    }

    if (primary_conn->disconnect() != STRIPE_SUCCESS) ret_code = 1;
    std::cout << (ret_code ? "FAILED" : "PASSED") << std::endl;
    return ret_code;
}
