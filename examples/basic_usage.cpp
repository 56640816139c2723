/**
 * @file basic_usage.cpp
 * @brief Basic usage example for qwenchat
 */

#include <qwenchat/qwenchat.hpp>
#include <iostream>

using namespace qwenchat;

int main() {
    std::cout << "qwenchat - Basic Usage Example\n\n";

    try {
        // Create client from ~/.qwenchat/.env and the environment
        Client client;

        // Uses the stored cookies; run the login tool first if this fails
        std::cout << "Starting client...\n";
        client.start();
        std::cout << "Client started!\n\n";

        auto session = client.create_session();
        std::cout << "Session created: " << session->session_id() << "\n\n";

        std::string answer = session->send_message(
            "What are three interesting facts about the C++ programming language?",
            "You are a concise assistant."
        );
        std::cout << "Response:\n" << answer << "\n\n";

        // Second turn threads onto the first
        answer = session->send_message("Summarize that in one sentence.");
        std::cout << "Follow-up:\n" << answer << "\n";

        client.stop();
        std::cout << "Done!\n";

    } catch (const QwenChatError& e) {
        std::cerr << "qwenchat Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
