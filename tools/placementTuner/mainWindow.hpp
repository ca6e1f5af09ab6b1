#pragma once

#include "placement/session.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QComboBox;
class QLabel;

namespace tabletop {

//! What the tuner shows.
enum class TunerView { Board, Pipeline };

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	//! User input forwarded to the simulation. Gestures are applied as one Began/Changed/Ended sequence.
	struct Callbacks {
		std::function<void()> onTap;
		std::function<void(float)> onRotate;  //!< Radians.
		std::function<void(float)> onPinch;   //!< Scale factor.
		std::function<void()> onSwapAxes;
		std::function<void(float)> onNoiseChanged; //!< Meters.
		std::function<void(TunerView)> onViewChanged;
	};

public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setStatus(const QString& status);
	void setMode(placement::PlacementMode mode);

	void connect(Callbacks callbacks);
	TunerView selectedView() const;

private:
	void buildLayout();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_viewCombo{nullptr};
	QComboBox* m_noiseCombo{nullptr};
	QLabel* m_modeLabel{nullptr};
	QLabel* m_statusLabel{nullptr};
	Callbacks m_callbacks{};
};

} // namespace tabletop
