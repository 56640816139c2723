/**
 * @file streaming.cpp
 * @brief Reasoning display example for qwenchat
 */

#include <qwenchat/qwenchat.hpp>
#include <iostream>

using namespace qwenchat;

int main() {
    std::cout << "qwenchat - Reasoning Example\n\n";

    try {
        Client client;
        client.start();

        SessionConfig config;
        config.reasoning = ReasoningSettings{true, DEFAULT_THINKING_BUDGET};

        auto session = client.create_session(config);

        // Reasoning arrives as blocks, the answer once at the end
        session->on([](const SessionEvent& event) {
            switch (event.event_type) {
                case EventType::ReasoningBlock:
                    std::cout << "[thinking]\n"
                              << event.data["content"].get<std::string>() << "\n";
                    break;
                case EventType::AnswerStarted:
                    std::cout << "[answer]\n";
                    break;
                case EventType::AssistantMessage:
                    std::cout << event.data["content"].get<std::string>()
                              << "\n--- Complete ---\n";
                    break;
                case EventType::SessionError:
                    std::cerr << "Error: " << event.data["error"].get<std::string>() << "\n";
                    break;
                default:
                    break;
            }
        });

        session->send("Why is the sky blue? Think it through.");

        client.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
