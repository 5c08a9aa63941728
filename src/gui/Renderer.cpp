#include "Renderer.hpp"
#include <cmath>
#include <algorithm>

namespace {

const float kNodeRadius   = 14.f;
const float kPacketRadius = 4.f;

} // namespace

Renderer::Renderer(sf::RenderWindow& window, const Network& network)
    : window_(window), network_(network)
{
    updateLayout();
}

const NodeVisual* Renderer::findNodeVisual(int routerId) const
{
    for (const auto& v : visuals_) {
        if (v.routerId == routerId) return &v;
    }
    return nullptr;
}

void Renderer::updateLayout()
{
    visuals_.clear();
    links_.clear();

    const float radius = 0.35f * static_cast<float>(std::min(window_.getSize().x, window_.getSize().y));
    const sf::Vector2f center(
        window_.getSize().x / 2.f,
        window_.getSize().y / 2.f
    );

    const auto& routers = network_.routers();
    const std::size_t n = routers.size();
    if (n == 0) return;

    for (std::size_t i = 0; i < n; ++i) {
        float angle =
            static_cast<float>(i) / static_cast<float>(n) * 2.f * 3.14159265f;

        sf::Vector2f pos = {
            center.x + radius * std::cos(angle),
            center.y + radius * std::sin(angle)
        };

        visuals_.push_back(NodeVisual{ routers[i]->id(), pos });

        // links are symmetric, keep one per pair
        for (const auto& link : routers[i]->links()) {
            if (routers[i]->id() < link.neighbour->id()) {
                links_.push_back(LinkVisual{ routers[i]->id(), link.neighbour->id(), link.delay });
            }
        }
    }
}

void Renderer::draw()
{
    // draw links
    for (const auto& link : links_) {
        const NodeVisual* a = findNodeVisual(link.nodeA);
        const NodeVisual* b = findNodeVisual(link.nodeB);
        if (!a || !b) continue;

        sf::Vertex line[] = {
            sf::Vertex(a->position, sf::Color(120, 120, 120)),
            sf::Vertex(b->position, sf::Color(120, 120, 120))
        };
        window_.draw(line, 2, sf::Lines);
    }
    // draw packets on links, progress = elapsed share of the hop delay
    for (const auto& pkt : network_.packetsInTransit()) {
        if (!pkt.lastHop || !pkt.via) continue;
        const NodeVisual* from = findNodeVisual(pkt.lastHop->id());
        const NodeVisual* to   = findNodeVisual(pkt.via->id());
        if (!from || !to) continue;

        float t = 1.f;
        if (pkt.hopDelay > 0) {
            t = 1.f - static_cast<float>(pkt.delay) / static_cast<float>(pkt.hopDelay);
        }
        t = std::max(0.f, std::min(1.f, t));

        sf::Vector2f pos = (1.f - t) * from->position + t * to->position;

        sf::CircleShape p(kPacketRadius);
        p.setOrigin(kPacketRadius, kPacketRadius);
        p.setPosition(pos);

        if (pkt.isReply) {
            p.setFillColor(sf::Color(80, 200, 255));  // cyan-ish
        } else {
            p.setFillColor(sf::Color(255, 80, 80));   // reddish
        }

        window_.draw(p);
    }
    // draw routers on top
    for (const auto& v : visuals_) {
        const Router* router = network_.getRouter(v.routerId);
        if (!router) continue;

        sf::CircleShape circle(kNodeRadius);
        circle.setOrigin(kNodeRadius, kNodeRadius);
        circle.setPosition(v.position);
        circle.setOutlineThickness(2.f);
        circle.setOutlineColor(sf::Color::White);

        if (router->input().empty() && router->output().empty()) {
            circle.setFillColor(sf::Color(100, 200, 100));   // idle
        } else {
            circle.setFillColor(sf::Color(250, 150, 100));   // packets queued
        }
        window_.draw(circle);
    }
}

int Renderer::pickNode(const sf::Vector2f& p) const
{
    const float radius2 = kNodeRadius * kNodeRadius;

    for (const auto& v : visuals_) {
        sf::Vector2f d = p - v.position;
        if (d.x * d.x + d.y * d.y <= radius2 * 1.5f * 1.5f) {
            return v.routerId;
        }
    }
    return -1;
}

static float distanceToSegment(sf::Vector2f p, sf::Vector2f a, sf::Vector2f b)
{
    sf::Vector2f ab = b - a;
    float ab2 = ab.x * ab.x + ab.y * ab.y;
    if (ab2 == 0.f) return 1e9f;
    float t = ((p.x - a.x) * ab.x + (p.y - a.y) * ab.y) / ab2;
    t = std::max(0.f, std::min(1.f, t));
    sf::Vector2f proj = a + t * ab;
    sf::Vector2f d = p - proj;
    return std::sqrt(d.x * d.x + d.y * d.y);
}

int Renderer::pickLink(const sf::Vector2f& p) const
{
    float bestDist = 8.f; // click tolerance in pixels
    int bestIdx = -1;

    for (std::size_t i = 0; i < links_.size(); ++i) {
        const NodeVisual* a = findNodeVisual(links_[i].nodeA);
        const NodeVisual* b = findNodeVisual(links_[i].nodeB);
        if (!a || !b) continue;

        float d = distanceToSegment(p, a->position, b->position);
        if (d < bestDist) {
            bestDist = d;
            bestIdx = static_cast<int>(i);
        }
    }
    return bestIdx;
}
