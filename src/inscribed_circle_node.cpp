#include "incircle/inscribed_circle.hpp"
#include "incircle/polygon_io.hpp"
#include "incircle/polygon_utils.hpp"

#include <ros/ros.h>
#include <ros/console.h>
#include <geometry_msgs/PointStamped.h>
#include <geometry_msgs/PolygonStamped.h>
#include <std_msgs/Float64.h>

#include <string>

struct Config
{
    std::string polygonTopic;
    std::string centerTopic;
    std::string radiusTopic;
    std::string polygonFile;
    bool checkSimple;
    double solverTolerance;

    Config(const ros::NodeHandle &nh_priv)
    {
        nh_priv.param<std::string>("PolygonTopic", polygonTopic, "/polygon");
        nh_priv.param<std::string>("CenterTopic", centerTopic, "/inscribed_circle/center");
        nh_priv.param<std::string>("RadiusTopic", radiusTopic, "/inscribed_circle/radius");
        nh_priv.param<std::string>("PolygonFile", polygonFile, "");
        nh_priv.param("CheckSimple", checkSimple, true);
        nh_priv.param("SolverTolerance", solverTolerance, 1.0e-7);
    }
};

class InscribedCircleServer
{
private:
    Config config;

    ros::NodeHandle nh;
    ros::Subscriber polygonSub;
    ros::Publisher centerPub;
    ros::Publisher radiusPub;

    incircle::Options options;
    lp::SeidelSolver solver;

public:
    InscribedCircleServer(const Config &conf,
                          ros::NodeHandle &nh_)
        : config(conf),
          nh(nh_),
          solver(conf.solverTolerance)
    {
        options.checkSimple = config.checkSimple;

        centerPub = nh.advertise<geometry_msgs::PointStamped>(config.centerTopic, 1);
        radiusPub = nh.advertise<std_msgs::Float64>(config.radiusTopic, 1);
        polygonSub = nh.subscribe(config.polygonTopic, 1, &InscribedCircleServer::polygonCallBack, this,
                                  ros::TransportHints().tcpNoDelay());
    }

    inline bool solve(const Eigen::Matrix2Xd &polygon,
                      incircle::Circle &circle) const
    {
        const int status = incircle::maxInscribedCircle(polygon, circle, solver, options);
        if (status != incircle::SUCCESS)
        {
            ROS_WARN("Inscribed circle of %d vertices failed: %s",
                     (int)polygon.cols(), incircle::statusString(status));
            return false;
        }

        Eigen::Matrix2Xd vertices;
        polygon_utils::openRing(polygon, vertices);
        if (!polygon_utils::isConvex(vertices))
        {
            ROS_WARN("Polygon is not convex, circle is only the largest one inside its kernel");
        }

        ROS_INFO("Inscribed circle: center (%f, %f), radius %f",
                 circle.center(0), circle.center(1), circle.radius);
        return true;
    }

    inline void loadFromFile()
    {
        if (config.polygonFile.empty())
        {
            return;
        }

        Eigen::Matrix2Xd polygon;
        if (!polygon_io::loadPolygon(config.polygonFile, polygon))
        {
            ROS_WARN("Cannot read polygon from %s", config.polygonFile.c_str());
            return;
        }

        incircle::Circle circle;
        solve(polygon, circle);
    }

    inline void polygonCallBack(const geometry_msgs::PolygonStamped::ConstPtr &msg)
    {
        const int n = msg->polygon.points.size();
        Eigen::Matrix2Xd polygon(2, n);
        for (int i = 0; i < n; i++)
        {
            polygon(0, i) = msg->polygon.points[i].x;
            polygon(1, i) = msg->polygon.points[i].y;
        }

        incircle::Circle circle;
        if (!solve(polygon, circle))
        {
            return;
        }

        geometry_msgs::PointStamped centerMsg;
        centerMsg.header = msg->header;
        centerMsg.point.x = circle.center(0);
        centerMsg.point.y = circle.center(1);
        centerMsg.point.z = 0.0;

        std_msgs::Float64 radiusMsg;
        radiusMsg.data = circle.radius;

        centerPub.publish(centerMsg);
        radiusPub.publish(radiusMsg);
    }
};

int main(int argc, char **argv)
{
    ros::init(argc, argv, "inscribed_circle_node");
    ros::NodeHandle nh_;

    InscribedCircleServer server(Config(ros::NodeHandle("~")), nh_);
    server.loadFromFile();

    ros::spin();

    return 0;
}
