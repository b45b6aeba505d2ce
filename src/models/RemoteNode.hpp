#ifndef REMOTENODE_HPP
#define REMOTENODE_HPP

#include <string>

// One remote store endpoint (a single server or a cluster seed).
struct RemoteNode {
    std::string host;
    int port = 6379;

    std::string address() const {
        return host + ":" + std::to_string(port);
    }

    bool operator==(const RemoteNode& other) const {
        return host == other.host && port == other.port;
    }
};

#endif // REMOTENODE_HPP
