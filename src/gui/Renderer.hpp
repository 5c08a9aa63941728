#pragma once
#include <SFML/Graphics.hpp>
#include "../sim/Network.hpp"
#include <vector>

struct NodeVisual
{
    int routerId;
    sf::Vector2f position;
};

struct LinkVisual
{
    int nodeA;
    int nodeB;
    int delay;
};

class Renderer
{
public:
    Renderer(sf::RenderWindow& window, const Network& network);

    void updateLayout();
    void draw();

    int pickNode(const sf::Vector2f& point) const;
    // index into links(), -1 when nothing is close enough
    int pickLink(const sf::Vector2f& point) const;

    const std::vector<LinkVisual>& links() const { return links_; }
private:
    const NodeVisual* findNodeVisual(int routerId) const;

    sf::RenderWindow&       window_;
    const Network&          network_;
    std::vector<NodeVisual> visuals_;
    std::vector<LinkVisual> links_;
};
