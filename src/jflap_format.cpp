#include "../include/serializer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tinyxml2.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace serializer
{
    // namespaces aliases
    using namespace tinyxml2;

    using dfa::ErrorCode;
    using dfa::make_error;
    using dfa::Result;

    namespace helpers
    {
        static auto child_text(XMLElement* element, const char* name) -> std::optional<std::string>
        {
            if (auto *pChild = element->FirstChildElement(name); pChild != nullptr)
            {
                const char* text = pChild->GetText();
                return std::string{text != nullptr ? text : ""};
            }
            return std::nullopt;
        }

        static auto has_child(XMLElement* element, const char* name) -> bool
        {
            return element->FirstChildElement(name) != nullptr;
        }

        // jflap ids are numeric strings, surrounding whitespace is not significant
        static auto trim(std::string_view s) -> std::string
        {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return "";
            }
            const auto last = s.find_last_not_of(" \t\r\n");
            return std::string{s.substr(first, last - first + 1)};
        }

        // states and transitions live under <automaton> in current files and
        // directly under <structure> in older ones
        static auto automaton_element(XMLElement* pRoot) -> XMLElement*
        {
            if (auto *pAutomaton = pRoot->FirstChildElement("automaton"); pAutomaton != nullptr)
            {
                return pAutomaton;
            }
            return pRoot;
        }
    }

    struct JflapState
    {
        std::string m_id;
        std::string m_name;
        bool m_is_initial;
        bool m_is_final;
    };

    struct JflapTransition
    {
        std::string m_from;
        std::string m_to;
        dfa::Symbol m_read;
    };

    static auto states_from_xml_element(XMLElement* pAutomaton) -> Result<std::vector<JflapState>>
    {
        std::vector<JflapState> states;
        for (auto *pState = pAutomaton->FirstChildElement("state"); pState != nullptr;
             pState = pState->NextSiblingElement("state"))
        {
            const char* id = pState->Attribute("id");
            if (id == nullptr)
            {
                return make_error(ErrorCode::Schema, "state on line {} has no id", pState->GetLineNum());
            }
            const char* name = pState->Attribute("name");

            states.push_back(JflapState{
                helpers::trim(id),
                name != nullptr ? std::string{name} : helpers::trim(id),
                helpers::has_child(pState, "initial"),
                helpers::has_child(pState, "final")
            });
        }
        return states;
    }

    static auto transitions_from_xml_element(XMLElement* pAutomaton) -> Result<std::vector<JflapTransition>>
    {
        std::vector<JflapTransition> transitions;
        for (auto *pTransition = pAutomaton->FirstChildElement("transition"); pTransition != nullptr;
             pTransition = pTransition->NextSiblingElement("transition"))
        {
            auto from = helpers::child_text(pTransition, "from");
            if (!from)
            {
                return make_error(ErrorCode::Schema, "transition on line {} has no <from>", pTransition->GetLineNum());
            }
            auto to = helpers::child_text(pTransition, "to");
            if (!to)
            {
                return make_error(ErrorCode::Schema, "transition on line {} has no <to>", pTransition->GetLineNum());
            }

            // an absent or empty <read> is a lambda transition
            dfa::Symbol read = dfa::epsilon;
            if (auto text = helpers::child_text(pTransition, "read"); text && !text->empty())
            {
                if (text->size() > 1)
                {
                    return make_error(
                        ErrorCode::Schema,
                        "transition on line {} reads '{}', only single symbols are supported",
                        pTransition->GetLineNum(), text.value()
                    );
                }
                read = text->front();
            }

            transitions.push_back(JflapTransition{helpers::trim(from.value()), helpers::trim(to.value()), read});
        }
        return transitions;
    }

    auto load_jflap(std::string_view xml) -> Result<dfa::Automaton>
    {
        XMLDocument doc;
        doc.Parse(xml.data(), xml.size());
        if (doc.ErrorID() != XML_SUCCESS)
        {
            return make_error(ErrorCode::Parse, "invalid JFLAP markup: {}", doc.ErrorStr());
        }

        XMLElement *pRoot = doc.RootElement();
        if (pRoot == nullptr || std::string_view{pRoot->Name()} != "structure")
        {
            return make_error(ErrorCode::Schema, "a JFLAP file must have a <structure> root element");
        }

        if (auto type = helpers::child_text(pRoot, "type"); type && helpers::trim(type.value()) != "fa")
        {
            return make_error(ErrorCode::Schema, "JFLAP structure of type '{}' is not a finite automaton", type.value());
        }

        XMLElement *pAutomaton = helpers::automaton_element(pRoot);
        auto states = states_from_xml_element(pAutomaton);
        if (!states)
        {
            return tl::unexpected<dfa::Error>(states.error());
        }
        auto transitions = transitions_from_xml_element(pAutomaton);
        if (!transitions)
        {
            return tl::unexpected<dfa::Error>(transitions.error());
        }

        // the model is assembled locally and only handed out once complete
        dfa::Automaton automaton;
        std::unordered_map<std::string, std::string> id_to_name;
        for (const auto& state : states.value())
        {
            if (!id_to_name.emplace(state.m_id, state.m_name).second)
            {
                return make_error(ErrorCode::DuplicateState, "JFLAP state id '{}' appears more than once", state.m_id);
            }
            if (auto added = automaton.add_state(state.m_name, state.m_is_initial, state.m_is_final); !added)
            {
                return tl::unexpected<dfa::Error>(added.error());
            }
        }

        for (const auto& transition : transitions.value())
        {
            auto from = id_to_name.find(transition.m_from);
            if (from == id_to_name.end())
            {
                return make_error(ErrorCode::UnknownState, "transition leaves unknown state id '{}'", transition.m_from);
            }
            auto to = id_to_name.find(transition.m_to);
            if (to == id_to_name.end())
            {
                return make_error(ErrorCode::UnknownState, "transition enters unknown state id '{}'", transition.m_to);
            }

            if (auto added = automaton.import_transition(from->second, transition.m_read, to->second); !added)
            {
                return tl::unexpected<dfa::Error>(added.error());
            }
        }

        spdlog::info("loaded JFLAP automaton with {} states and {} transitions",
            automaton.states().size(), automaton.transitions().size());
        return automaton;
    }
}
