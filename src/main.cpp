#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <memory>
#include <unistd.h>

#include "ChatNode.hpp"
#include "Config.hpp"
#include "Identity.hpp"
#include "Utils.hpp"

using namespace std;
using namespace lanchat;

static atomic<bool> g_running(true);
static mutex g_outputMtx;

void signal_handler(int signum){
    (void)signum;
    g_running = false;
    // unblock getline
    ::close(STDIN_FILENO);
}

static void printHelp() {
    lock_guard<mutex> lk(g_outputMtx);
    cout << "@@@ Commands:\n"
         << "@@@   /peers, /p       list known peers\n"
         << "@@@   /broadcast, /b   announce this node again\n"
         << "@@@   /state, /s       show identity, ports and counters\n"
         << "@@@   /help, /h        show this help\n"
         << "@@@   /quit, /q        leave the chat\n"
         << "@@@ Anything else is sent as a chat message." << endl;
}

static void printPeers(const ChatNode& node) {
    auto peers = node.peers();
    const auto now = Clock::now();

    lock_guard<mutex> lk(g_outputMtx);
    if (peers.empty()) {
        cout << "@@@ No peers known yet." << endl;
        return;
    }
    cout << "@@@ " << peers.size() << " peer(s):" << endl;
    for (const auto& peer : peers) {
        const auto age = chrono::duration_cast<chrono::seconds>(now - peer.lastSeen).count();
        cout << "@@@   " << left << setw(static_cast<int>(MAX_DISPLAY_NAME_LENGTH)) << peer.displayName
             << right << " [" << Identity::shortHex(peer.id) << "] " << peer.endpoint.key()
             << "  seen " << age << "s ago" << endl;
    }
}

static void printState(const ChatNode& node) {
    const auto stats = node.stats();
    const auto address = detectLocalAddress();

    lock_guard<mutex> lk(g_outputMtx);
    cout << "@@@ User:           " << node.identity().displayName << endl;
    cout << "@@@ Peer id:        " << Identity::toHex(node.identity().id) << endl;
    cout << "@@@ Local address:  " << (address ? *address : string("unknown")) << endl;
    cout << "@@@ Receive port:   " << node.localPort() << endl;
    cout << "@@@ Discovery port: ";
    if (node.hasDiscoverySocket()) cout << node.config().discoveryPort << endl;
    else cout << "not bound" << endl;
    cout << "@@@ Forwarding:     " << (node.config().forwardChat ? "on" : "off") << endl;
    cout << "@@@ Peers:          " << stats.peerCount << endl;
    cout << "@@@ Received:       " << stats.datagramsReceived
         << " (" << stats.malformedDropped << " malformed)" << endl;
    cout << "@@@ Chats shown:    " << stats.chatsDisplayed
         << ", duplicates " << stats.duplicatesSuppressed
         << ", forwarded " << stats.chatsForwarded << endl;
    cout << "@@@ Peers expired:  " << stats.peersEvicted << endl;
    cout << "@@@ Hellos sent:    " << stats.hellosSent << endl;
}

int main(int argc, char** argv) {
    const string program = argc > 0 ? argv[0] : "lanchat";

    CommandLineOptions options;
    try {
        options = parseArguments(vector<string>(argv + 1, argv + argc));
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl << usage(program);
        return 2;
    }

    if (options.showHelp) {
        cout << usage(program);
        return 0;
    }

    if (!Identity::initialize()) {
        cerr << "Failed to initialize crypto (sodium)." << endl;
        return 1;
    }

    unique_ptr<ChatNode> node;
    try {
        node = make_unique<ChatNode>(options.node);
        node->setDisplayHandler([](const string& sender, const string& text, uint64_t timestamp) {
            lock_guard<mutex> lk(g_outputMtx);
            cout << "[" << sender << "]: " << text << "     (" << formatTimestamp(timestamp) << ")" << endl;
        });
        node->start();
    } catch (const BindError& e) {
        cerr << "Error: cannot start node: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    // Handle signals
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    cout << "@@@ Welcome to the LAN chat, " << node->identity().displayName << "!" << endl;
    cout << "@@@ Listening on port " << node->localPort() << ". Type /help for commands." << endl;

    string line;
    while (g_running && getline(cin, line)) {
        line = trim(line);
        if (line.empty()) continue;

        if (line == "/quit" || line == "/q") {
            break;
        } else if (line == "/peers" || line == "/p") {
            printPeers(*node);
        } else if (line == "/broadcast" || line == "/b") {
            node->announce();
            lock_guard<mutex> lk(g_outputMtx);
            cout << "@@@ Announcement sent." << endl;
        } else if (line == "/state" || line == "/s") {
            printState(*node);
        } else if (line == "/help" || line == "/h") {
            printHelp();
        } else if (!node->submit(line)) {
            lock_guard<mutex> lk(g_outputMtx);
            cout << "@@@ Message not sent." << endl;
        }
    }

    cout << "@@@ Shutting down..." << endl;
    node->stop();
    return 0;
}
