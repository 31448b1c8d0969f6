#ifndef DIALCAST_TEST_FAKE_TRANSPORT_HPP
#define DIALCAST_TEST_FAKE_TRANSPORT_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "dialcast/http/client.hpp"

// Answers requests from a table keyed by "METHOD url"; unknown targets are unreachable
class fake_transport : public dialcast::http::transport
{
public:

    void answer(const std::string& method, const std::string& target, dialcast::http::response res)
    {
        m_answers[method + " " + target] = std::move(res);
    }

    dialcast::http::response perform(const dialcast::http::client_request& req) override
    {
        requests.push_back(req);
        auto it = m_answers.find(req.method + " " + req.target);
        if(it == m_answers.end())
            throw std::runtime_error {"Connection refused: " + req.target};
        return it->second;
    }

    std::vector<dialcast::http::client_request> requests;

private:

    std::map<std::string, dialcast::http::response> m_answers;

};

#endif
