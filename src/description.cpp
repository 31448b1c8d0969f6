#include "dialcast/description.hpp"
#include "dialcast/error.hpp"
#include "dialcast/log.hpp"
#include "dialcast/utils.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <rapidxml/rapidxml.hpp>

using namespace rapidxml;
using nlohmann::json;

namespace dialcast
{

icon default_icon()
{
    return icon {"image/png", "144", "144", "32", "/img/icon.png"};
}

const char* to_string(app_state state)
{
    switch(state)
    {
        case app_state::stopped: return "stopped";
        case app_state::starting: return "starting";
        case app_state::running: return "running";
    }
    return "stopped";
}

app_state parse_app_state(std::string_view name)
{
    if(name == "stopped")
        return app_state::stopped;
    else if(name == "starting")
        return app_state::starting;
    else if(name == "running")
        return app_state::running;

    throw std::invalid_argument {"Unknown app state: " + std::string {name}};
}

// Element names only, bytes above 0x7f are accepted as part of a multibyte character
static bool is_xml_name(std::string_view name)
{
    if(name.empty())
        return false;

    for(size_t i = 0; i < name.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        const bool start = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':' || c >= 0x80;
        const bool other = (c >= '0' && c <= '9') || c == '-' || c == '.';
        if(!start && (i == 0 || !other))
            return false;
    }
    return true;
}

static std::string xml_escape(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for(char c : text)
    {
        switch(c)
        {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

std::string render_device_description(const device_description& desc)
{
    std::string icons;
    for(const auto& i : desc.icons)
    {
        icons += fmt::format(
            "      <icon>\n"
            "        <mimetype>{}</mimetype>\n"
            "        <width>{}</width>\n"
            "        <height>{}</height>\n"
            "        <depth>{}</depth>\n"
            "        <url>{}</url>\n"
            "      </icon>\n",
            xml_escape(i.mimetype), xml_escape(i.width), xml_escape(i.height), xml_escape(i.depth), xml_escape(i.url));
    }

    // The service block only tells control points that there are no further UPnP services
    return fmt::format(
        "<?xml version=\"1.0\"?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
        "  <specVersion>\n"
        "    <major>1</major>\n"
        "    <minor>0</minor>\n"
        "  </specVersion>\n"
        "  <URLBase>{}</URLBase>\n"
        "  <device>\n"
        "    <deviceType>{}</deviceType>\n"
        "    <friendlyName>{}</friendlyName>\n"
        "    <manufacturer>{}</manufacturer>\n"
        "    <modelName>{}</modelName>\n"
        "    <UDN>uuid:{}</UDN>\n"
        "    <iconList>\n"
        "{}"
        "    </iconList>\n"
        "    <serviceList>\n"
        "      <service>\n"
        "        <serviceType>{}</serviceType>\n"
        "        <serviceId>urn:dial-multiscreen-org:serviceId:dial</serviceId>\n"
        "        <controlURL>/ssdp/notfound</controlURL>\n"
        "        <eventSubURL>/ssdp/notfound</eventSubURL>\n"
        "        <SCPDURL>/ssdp/notfound</SCPDURL>\n"
        "      </service>\n"
        "    </serviceList>\n"
        "  </device>\n"
        "</root>\n",
        xml_escape(desc.url_base),
        xml_escape(desc.device_type),
        xml_escape(desc.friendly_name),
        xml_escape(desc.manufacturer),
        xml_escape(desc.model_name),
        xml_escape(desc.uuid),
        icons,
        dial_service_type);
}

std::string render_app_description(const app_description& desc)
{
    std::string ns;
    for(const auto& it : desc.namespaces)
        ns += fmt::format(" xmlns:{}=\"{}\"", it.first, xml_escape(it.second));

    std::string xml = fmt::format(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<service xmlns=\"urn:dial-multiscreen-org:schemas:dial\"{} dialVer=\"1.7\">\n"
        "  <name>{}</name>\n"
        "  <options allowStop=\"{}\"/>\n"
        "  <state>{}</state>\n",
        ns, xml_escape(desc.name), desc.allow_stop ? "true" : "false", to_string(desc.state));

    if(!desc.rel.empty() && !desc.href.empty())
        xml += fmt::format("  <link rel=\"{}\" href=\"{}\" />\n", xml_escape(desc.rel), xml_escape(desc.href));

    if(desc.additional_data)
    {
        xml += "  <additionalData>\n";
        for(const auto& it : *desc.additional_data)
        {
            if(!is_xml_name(it.first))
            {
                log::warn("Skipping additionalData key \"{}\" of {}, not a valid XML name", it.first, desc.name);
                continue;
            }
            xml += fmt::format("    <{0}>{1}</{0}>\n", it.first, xml_escape(it.second));
        }
        xml += "  </additionalData>\n";
    }

    xml += "</service>\n";
    return xml;
}

static std::vector<char> to_buffer(std::string_view text)
{
    // rapidxml parses in place and needs a terminated, mutable buffer
    std::vector<char> buffer {text.begin(), text.end()};
    buffer.push_back('\0');
    return buffer;
}

static std::string child_value(const xml_node<char>* node, const char* name)
{
    const xml_node<char>* child = node->first_node(name);
    if(child == nullptr)
        return {};
    return std::string {utils::trim(std::string_view {child->value(), child->value_size()})};
}

device_description parse_device_description(std::string_view text)
{
    std::vector<char> buffer = to_buffer(text);
    xml_document<char> doc;
    try {
        doc.parse<0>(buffer.data());
    } catch(const rapidxml::parse_error& e) {
        throw document_error {std::string {"Malformed device description: "} + e.what()};
    }

    const xml_node<char>* root = doc.first_node("root");
    if(root == nullptr)
        throw document_error {"Device description has no root element"};
    const xml_node<char>* device_node = root->first_node("device");
    if(device_node == nullptr)
        throw document_error {"Device description has no device element"};

    device_description desc;
    desc.url_base = child_value(root, "URLBase");
    desc.device_type = child_value(device_node, "deviceType");
    desc.friendly_name = child_value(device_node, "friendlyName");
    desc.manufacturer = child_value(device_node, "manufacturer");
    desc.model_name = child_value(device_node, "modelName");

    std::string udn = child_value(device_node, "UDN");
    desc.uuid = (udn.compare(0, 5, "uuid:") == 0) ? udn.substr(5) : udn;

    // One or many <icon> elements end up in the same list
    const xml_node<char>* icon_list = device_node->first_node("iconList");
    if(icon_list != nullptr)
    {
        for(const xml_node<char>* icon_node = icon_list->first_node("icon"); icon_node; icon_node = icon_node->next_sibling("icon"))
        {
            desc.icons.push_back(icon {
                child_value(icon_node, "mimetype"),
                child_value(icon_node, "width"),
                child_value(icon_node, "height"),
                child_value(icon_node, "depth"),
                child_value(icon_node, "url")
            });
        }
    }

    return desc;
}

static std::string local_name(const char* name, size_t size)
{
    std::string_view view {name, size};
    size_t colon = view.find(':');
    return std::string {(colon == std::string_view::npos) ? view : view.substr(colon + 1)};
}

// Repeated keys turn into arrays
static void add_value(json& obj, const std::string& key, json value)
{
    auto it = obj.find(key);
    if(it == obj.end())
    {
        obj[key] = std::move(value);
    }
    else
    {
        if(!it->is_array())
            *it = json::array({*it});
        it->push_back(std::move(value));
    }
}

static json node_to_json(const xml_node<char>* node)
{
    json obj = json::object();
    bool structured = false;
    std::string text;

    for(const xml_attribute<char>* attr = node->first_attribute(); attr; attr = attr->next_attribute())
    {
        add_value(obj, local_name(attr->name(), attr->name_size()), std::string {attr->value(), attr->value_size()});
        structured = true;
    }

    for(const xml_node<char>* child = node->first_node(); child; child = child->next_sibling())
    {
        if(child->type() == node_element)
        {
            add_value(obj, local_name(child->name(), child->name_size()), node_to_json(child));
            structured = true;
        }
        else if(child->type() == node_data || child->type() == node_cdata)
        {
            text.append(child->value(), child->value_size());
        }
    }

    std::string trimmed {utils::trim(text)};
    if(!structured)
        return trimmed;

    if(!trimmed.empty())
        obj["_"] = trimmed;
    return obj;
}

json parse_app_description(std::string_view text)
{
    std::vector<char> buffer = to_buffer(text);
    xml_document<char> doc;
    try {
        doc.parse<0>(buffer.data());
    } catch(const rapidxml::parse_error& e) {
        throw document_error {std::string {"Malformed app description: "} + e.what()};
    }

    const xml_node<char>* root = doc.first_node();
    if(root == nullptr)
        throw document_error {"App description has no root element"};

    return node_to_json(root);
}

} // namespace dialcast
