#ifndef BROKER_HPP
#define BROKER_HPP

// Publish side of a long-lived message broker session
class Broker {
public:
    virtual ~Broker() = default;

    // Returns the message id (>= 0) or a negative value on failure
    virtual int publish(const char* topic, const char* payload, int qos, bool retain) = 0;

    virtual bool isConnected() const = 0;
};

#endif // BROKER_HPP
