#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QPushButton>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <array>
#include <cstddef>
#include <numbers>
#include <utility>

namespace tabletop {

namespace {

struct NoiseLevel {
	const char* name;
	float meters;
};

static constexpr std::array<NoiseLevel, 4> NOISE_LEVELS = {{{"None", 0.f}, {"Low (1 cm)", 0.01f}, {"Medium (3 cm)", 0.03f}, {"High (8 cm)", 0.08f}}};

static constexpr float ROTATE_STEP = std::numbers::pi_v<float> / 12.f;
static constexpr float PINCH_STEP  = 1.1f;

} // namespace

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);
	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	painter.drawImage(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
}

QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty()) {
		return {};
	}

	cv::Mat bgr;
	if (mat.depth() == CV_8U) {
		bgr = mat;
	} else {
		cv::normalize(mat, bgr, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat rgb;
	switch (bgr.channels()) {
	case 1:
		cv::cvtColor(bgr, rgb, cv::COLOR_GRAY2RGB);
		break;
	case 3:
		cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
		break;
	case 4:
		cv::cvtColor(bgr, rgb, cv::COLOR_BGRA2RGB);
		break;
	default:
		return {};
	}

	// QImage does not own the buffer, copy before rgb goes out of scope.
	return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Placement Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setStatus(const QString& status) {
	m_statusLabel->setText(status);
}

void MainWindow::setMode(const placement::PlacementMode mode) {
	m_modeLabel->setText(mode == placement::PlacementMode::Placing ? "Mode: Placing" : "Mode: Adjusting");
}

void MainWindow::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

TunerView MainWindow::selectedView() const {
	return m_viewCombo->currentIndex() == 0 ? TunerView::Board : TunerView::Pipeline;
}

void MainWindow::buildLayout() {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* controlRow = new QHBoxLayout();

	m_viewCombo = new QComboBox(rootWidget);
	m_viewCombo->addItem("Board");
	m_viewCombo->addItem("Samples + Board");
	m_viewCombo->setCurrentIndex(0);

	m_noiseCombo = new QComboBox(rootWidget);
	for (const auto& level: NOISE_LEVELS) {
		m_noiseCombo->addItem(level.name);
	}
	m_noiseCombo->setCurrentIndex(1);

	auto* tapButton    = new QPushButton("Tap", rootWidget);
	auto* leftButton   = new QPushButton("Rotate -", rootWidget);
	auto* rightButton  = new QPushButton("Rotate +", rootWidget);
	auto* shrinkButton = new QPushButton("Shrink", rootWidget);
	auto* growButton   = new QPushButton("Grow", rootWidget);
	auto* swapButton   = new QPushButton("Swap Plane Axes", rootWidget);

	m_modeLabel = new QLabel("Mode: Placing", rootWidget);

	controlRow->addWidget(new QLabel("View:", rootWidget));
	controlRow->addWidget(m_viewCombo);
	controlRow->addWidget(new QLabel("Noise:", rootWidget));
	controlRow->addWidget(m_noiseCombo);
	controlRow->addWidget(tapButton);
	controlRow->addWidget(leftButton);
	controlRow->addWidget(rightButton);
	controlRow->addWidget(shrinkButton);
	controlRow->addWidget(growButton);
	controlRow->addWidget(swapButton);
	controlRow->addStretch(1);
	controlRow->addWidget(m_modeLabel);

	m_matrixView  = new CvMatrixView(rootWidget);
	m_statusLabel = new QLabel(rootWidget);

	rootLayout->addLayout(controlRow);
	rootLayout->addWidget(m_matrixView, 1);
	rootLayout->addWidget(m_statusLabel);

	setCentralWidget(rootWidget);

	QObject::connect(m_viewCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_callbacks.onViewChanged) {
			m_callbacks.onViewChanged(selectedView());
		}
	});
	QObject::connect(m_noiseCombo, &QComboBox::currentIndexChanged, this, [this](int index) {
		if (m_callbacks.onNoiseChanged && index >= 0 && static_cast<std::size_t>(index) < NOISE_LEVELS.size()) {
			m_callbacks.onNoiseChanged(NOISE_LEVELS[static_cast<std::size_t>(index)].meters);
		}
	});
	QObject::connect(tapButton, &QPushButton::clicked, this, [this]() {
		if (m_callbacks.onTap) {
			m_callbacks.onTap();
		}
	});
	QObject::connect(leftButton, &QPushButton::clicked, this, [this]() {
		if (m_callbacks.onRotate) {
			m_callbacks.onRotate(-ROTATE_STEP);
		}
	});
	QObject::connect(rightButton, &QPushButton::clicked, this, [this]() {
		if (m_callbacks.onRotate) {
			m_callbacks.onRotate(ROTATE_STEP);
		}
	});
	QObject::connect(shrinkButton, &QPushButton::clicked, this, [this]() {
		if (m_callbacks.onPinch) {
			m_callbacks.onPinch(1.f / PINCH_STEP);
		}
	});
	QObject::connect(growButton, &QPushButton::clicked, this, [this]() {
		if (m_callbacks.onPinch) {
			m_callbacks.onPinch(PINCH_STEP);
		}
	});
	QObject::connect(swapButton, &QPushButton::clicked, this, [this]() {
		if (m_callbacks.onSwapAxes) {
			m_callbacks.onSwapAxes();
		}
	});
}

} // namespace tabletop
