#ifndef CONNECTIVITY_GATE_HPP
#define CONNECTIVITY_GATE_HPP

// "Is outbound network usable right now", asked before every publish attempt.
class ConnectivityGate {
public:
    virtual ~ConnectivityGate() = default;
    virtual bool isNetworkUsable() const = 0;
};

#endif // CONNECTIVITY_GATE_HPP
