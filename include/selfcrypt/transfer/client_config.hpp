#pragma once

#include "selfcrypt/encrypt/params.hpp"
#include "selfcrypt/network/network_client.hpp"
#include <cstddef>

namespace selfcrypt::core {
class Config;
}

namespace selfcrypt::transfer {

struct ClientConfig {
    encrypt::SelfEncryptionParams encryption;
    network::NetworkConfig network;
    
    // 0 picks the hardware concurrency
    size_t worker_threads = 0;
    
    // Compare the reassembled stream against the data map checksum
    bool verify_checksum = true;
    
    // Missing keys keep their defaults
    static ClientConfig from_config(const core::Config& config);
    
    bool validate() const;
};

}
